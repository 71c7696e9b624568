#include "label_deriver.hpp"

namespace counterfit {

size_t ArgmaxLabelDeriver::argmax(const Output &output) const {
  check(output.size() > 0);
  Eigen::Index idx = 0;
  output.maxCoeff(&idx);
  if (static_cast<size_t>(idx) >= vocabulary_.size()) {
    std::ostringstream os{};
    os << "output index " << idx << " has no label in a vocabulary of " << vocabulary_.size();
    throw std::out_of_range(os.str());
  }
  return idx;
}

std::vector<Label> ArgmaxLabelDeriver::derive_labels(const std::vector<Output> &outputs) const {
  std::vector<Label> labels{};
  labels.reserve(outputs.size());
  for (const auto &output : outputs) { labels.push_back(vocabulary_[argmax(output)]); }
  return labels;
}

ThresholdLabelDeriver::ThresholdLabelDeriver(std::vector<Label> vocabulary, size_t column,
                                             float threshold)
    : vocabulary_(std::move(vocabulary)), column_(column), threshold_(threshold) {
  if (vocabulary_.size() != 2) {
    throw std::invalid_argument("threshold labels need a vocabulary of exactly two labels");
  }
}

std::vector<Label> ThresholdLabelDeriver::derive_labels(const std::vector<Output> &outputs) const {
  std::vector<Label> labels{};
  labels.reserve(outputs.size());
  for (const auto &output : outputs) {
    check(static_cast<size_t>(output.size()) > column_);
    labels.push_back(output(column_) >= threshold_ ? vocabulary_[1] : vocabulary_[0]);
  }
  return labels;
}

}
