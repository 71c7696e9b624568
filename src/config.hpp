#ifndef COUNTERFIT_CONFIG_HPP
#define COUNTERFIT_CONFIG_HPP

#include "prelude.hpp"

namespace counterfit {

struct AttackConfig {
  std::string dir_{};
  std::string model_{};
  std::string input_op_{};
  std::string output_op_{};
  std::string dataset_{};
  std::string dataset_name_{};
  std::vector<int64_t> input_shape_{};
  std::vector<std::string> labels_{};
  std::vector<size_t> indexes_{};
  bool targeted_{};
  size_t target_class_{};
  float epsilon_{};
  size_t max_iter_{};
  float clip_min_{};
  float clip_max_{};
  bool logging_{};
  std::string attack_id_{};
  std::string output_{};
  std::string log_output_{};

  static AttackConfig from_args(int argc, char **argv);
};

// "3,32,32" -> {3, 32, 32}; std::nullopt on anything that is not a list of positive integers.
std::optional<std::vector<int64_t>> parse_shape(const std::string &s);

// "cat,dog" -> {"cat", "dog"}
std::vector<std::string> split_list(const std::string &s);

}

#endif //COUNTERFIT_CONFIG_HPP
