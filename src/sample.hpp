#ifndef COUNTERFIT_SAMPLE_HPP
#define COUNTERFIT_SAMPLE_HPP

#include "prelude.hpp"

#include <nlohmann/json.hpp>

namespace counterfit {

// Capability tag of a sample. All samples of one target share the same kind.
enum class SampleKind : uint8_t {
  NumericArray = 0,
  ByteBlob = 1,
  Text = 2,
};

const char *kind_name(SampleKind kind);

// Raw model output for one sample, stored verbatim.
using Output = Eigen::Array<float, Eigen::Dynamic, 1>;

using Label = std::string;

// Bit pattern of a sample prefixed by its kind.
using FingerprintKey = std::string;

struct Sample {
  SampleKind kind_{SampleKind::NumericArray};
  // Only meaningful for numeric arrays; values_ is stored flat in row-major order.
  std::vector<int64_t> shape_{};
  Eigen::Array<float, Eigen::Dynamic, 1> values_{};
  std::vector<uint8_t> bytes_{};
  std::string text_{};

  static Sample numeric(const Eigen::Array<float, Eigen::Dynamic, 1> &values,
                        std::vector<int64_t> shape = {});
  static Sample blob(std::vector<uint8_t> bytes);
  static Sample text(std::string text);

  // Number of scalar elements, bytes or characters.
  size_t size() const noexcept;

  void reshape(const std::vector<int64_t> &shape);

  FingerprintKey fingerprint() const;

  // Flattened, JSON-compatible view of the payload.
  nlohmann::json to_json() const;
};

bool operator==(const Sample &a, const Sample &b);
inline bool operator!=(const Sample &a, const Sample &b) { return !(a == b); }

int64_t shape_size(const std::vector<int64_t> &shape);

nlohmann::json output_to_json(const Output &output);

}

#endif //COUNTERFIT_SAMPLE_HPP
