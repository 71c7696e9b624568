#ifndef COUNTERFIT_LABEL_DERIVER_HPP
#define COUNTERFIT_LABEL_DERIVER_HPP

#include "sample.hpp"

namespace counterfit {

// Turns raw outputs into one label per row. Targets may swap in their own rule.
struct LabelDeriver {
  virtual std::vector<Label> derive_labels(const std::vector<Output> &outputs) const = 0;
  virtual ~LabelDeriver() {}
};

// Index of the maximum value in each row, looked up in the vocabulary. Ties go to the lowest index.
struct ArgmaxLabelDeriver : public LabelDeriver {
  std::vector<Label> vocabulary_;

  explicit ArgmaxLabelDeriver(std::vector<Label> vocabulary) : vocabulary_(std::move(vocabulary)) {}

  std::vector<Label> derive_labels(const std::vector<Output> &outputs) const override;

  size_t argmax(const Output &output) const;
};

// Binary decision on one column of the output:
// vocabulary_[1] if output(column_) >= threshold_, otherwise vocabulary_[0].
struct ThresholdLabelDeriver : public LabelDeriver {
  std::vector<Label> vocabulary_;
  size_t column_;
  float threshold_;

  ThresholdLabelDeriver(std::vector<Label> vocabulary, size_t column, float threshold);

  std::vector<Label> derive_labels(const std::vector<Output> &outputs) const override;
};

}

#endif //COUNTERFIT_LABEL_DERIVER_HPP
