#ifndef COUNTERFIT_TENSORFLOW_MODEL_HPP
#define COUNTERFIT_TENSORFLOW_MODEL_HPP

extern "C" {
#include <tensorflow/c/c_api.h>
};

#include "prelude.hpp"
#include "model.hpp"

namespace counterfit {

struct TFTensor {
  TF_Tensor *raw_{nullptr};
  float *data_{nullptr};

  TFTensor() = default;
  explicit TFTensor(const std::vector<int64_t> &dims) {
    check(dims.size() >= 1);
    int num_dims = dims.size();
    size_t len = sizeof(float);
    for (auto dim : dims) { len *= dim; }
    raw_ = TF_AllocateTensor(TF_FLOAT, dims.data(), num_dims, len);
    check(raw_ != nullptr);
    data_ = (float *) TF_TensorData(raw_);
  }
  // Takes ownership of raw, also when it is rejected.
  explicit TFTensor(TF_Tensor *raw) {
    check(raw != nullptr);
    if (TF_TensorType(raw) != TF_FLOAT) {
      TF_DeleteTensor(raw);
      throw std::invalid_argument("expected a float tensor");
    }
    raw_ = raw;
    data_ = (float *) TF_TensorData(raw_);
  }
  ~TFTensor() {
    if (raw_) { TF_DeleteTensor(raw_); }
  }
  TFTensor(const TFTensor &) = delete;
  TFTensor(TFTensor &&that) noexcept {
    raw_ = that.raw_;
    data_ = that.data_;
    that.raw_ = nullptr;
    that.data_ = nullptr;
  }

  inline float *get_data() noexcept {
    return data_;
  }
};

// A SavedModel classifier run through the TensorFlow C API. The whole batch goes through a single
// TF_SessionRun call.
class TensorflowModel : public Model {
 public:
  TensorflowModel(const std::string &export_dir,
                  const std::string &input_oper_name, const std::string &output_oper_name,
                  std::vector<int64_t> input_shape, int output_index = 0);
  TensorflowModel(const TensorflowModel &) = delete;
  ~TensorflowModel() override;

  std::vector<Output> run(const std::vector<Sample> &batch) override;

 private:
  void release() noexcept;

  TF_Status *status_{nullptr};
  TF_Session *session_{nullptr};
  TF_Graph *graph_{nullptr};
  TF_Operation *input_oper_{nullptr};
  TF_Operation *output_oper_{nullptr};
  int output_index_;
  std::vector<int64_t> input_shape_;
};

}

#endif //COUNTERFIT_TENSORFLOW_MODEL_HPP
