#include "sample.hpp"

namespace counterfit {

const char *kind_name(SampleKind kind) {
  switch (kind) {
    case SampleKind::NumericArray: return "numeric-array";
    case SampleKind::ByteBlob: return "byte-blob";
    case SampleKind::Text: return "text";
  }
  throw std::invalid_argument("unrecognized sample kind");
}

int64_t shape_size(const std::vector<int64_t> &shape) {
  int64_t size = 1;
  for (auto dim : shape) {
    check(dim >= 0);
    size *= dim;
  }
  return size;
}

Sample Sample::numeric(const Eigen::Array<float, Eigen::Dynamic, 1> &values,
                       std::vector<int64_t> shape) {
  Sample sample{};
  sample.kind_ = SampleKind::NumericArray;
  sample.values_ = values;
  if (shape.empty()) { shape.push_back(values.size()); }
  sample.reshape(shape);
  return sample;
}

Sample Sample::blob(std::vector<uint8_t> bytes) {
  Sample sample{};
  sample.kind_ = SampleKind::ByteBlob;
  sample.bytes_ = std::move(bytes);
  return sample;
}

Sample Sample::text(std::string text) {
  Sample sample{};
  sample.kind_ = SampleKind::Text;
  sample.text_ = std::move(text);
  return sample;
}

size_t Sample::size() const noexcept {
  switch (kind_) {
    case SampleKind::NumericArray: return values_.size();
    case SampleKind::ByteBlob: return bytes_.size();
    case SampleKind::Text: return text_.size();
  }
  return 0;
}

void Sample::reshape(const std::vector<int64_t> &shape) {
  if (kind_ != SampleKind::NumericArray) {
    throw std::invalid_argument(std::string("cannot reshape a ") + kind_name(kind_) + " sample");
  }
  if (shape_size(shape) != values_.size()) {
    std::ostringstream os{};
    os << "cannot reshape " << values_.size() << " values into shape (";
    for (size_t i = 0; i < shape.size(); i++) { os << (i ? "," : "") << shape[i]; }
    os << ")";
    throw std::invalid_argument(os.str());
  }
  shape_ = shape;
}

FingerprintKey Sample::fingerprint() const {
  FingerprintKey key{};
  key.push_back(static_cast<char>(kind_));
  switch (kind_) {
    case SampleKind::NumericArray: {
      // bit pattern of the floats, so 0.0f and -0.0f are different inputs
      const char *raw = reinterpret_cast<const char *>(values_.data());
      key.append(raw, sizeof(float) * values_.size());
      break;
    }
    case SampleKind::ByteBlob: {
      key.append(bytes_.begin(), bytes_.end());
      break;
    }
    case SampleKind::Text: {
      key.append(text_);
      break;
    }
  }
  return key;
}

nlohmann::json Sample::to_json() const {
  switch (kind_) {
    case SampleKind::NumericArray:
      return std::vector<float>(values_.data(), values_.data() + values_.size());
    case SampleKind::ByteBlob:
      return bytes_;
    case SampleKind::Text:
      return text_;
  }
  throw std::invalid_argument("unrecognized sample payload type");
}

bool operator==(const Sample &a, const Sample &b) {
  return a.fingerprint() == b.fingerprint() && a.shape_ == b.shape_;
}

nlohmann::json output_to_json(const Output &output) {
  return std::vector<float>(output.data(), output.data() + output.size());
}

}
