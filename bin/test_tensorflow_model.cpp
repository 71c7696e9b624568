#include "tensorflow_model.hpp"

using namespace counterfit;

void test_missing_export_dir() {
  // every failed load releases its status, graph and session
  for (int i = 0; i < 16; i++) {
    bool thrown = false;
    try {
      TensorflowModel model("/tmp/counterfit_no_such_saved_model", "x", "y", {2});
    } catch (const std::runtime_error &) {
      thrown = true;
    }
    check(thrown);
  }
}

void test_rejected_tensor() {
  const int64_t dims[1] = {2};
  TF_Tensor *raw = TF_AllocateTensor(TF_INT32, dims, 1, 2 * sizeof(int32_t));
  check(raw != nullptr);
  bool thrown = false;
  try {
    TFTensor tensor(raw);
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  check(thrown);
}

void test_tensor_move() {
  TFTensor xs(std::vector<int64_t>{3, 2});
  check(TF_NumDims(xs.raw_) == 2);
  check(TF_Dim(xs.raw_, 0) == 3);
  xs.get_data()[5] = 0.5f;

  TFTensor ys(std::move(xs));
  check(xs.raw_ == nullptr && xs.get_data() == nullptr);
  check(ys.get_data()[5] == 0.5f);
}

int main() {
  std::cout << "test_missing_export_dir()\n";
  test_missing_export_dir();
  std::cout << "test_rejected_tensor()\n";
  test_rejected_tensor();
  std::cout << "test_tensor_move()\n";
  test_tensor_move();

  return 0;
}
