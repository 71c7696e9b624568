#include "tensorflow_model.hpp"

namespace counterfit {

TensorflowModel::TensorflowModel(const std::string &export_dir,
                                 const std::string &input_oper_name,
                                 const std::string &output_oper_name,
                                 std::vector<int64_t> input_shape, int output_index)
    : output_index_(output_index), input_shape_(std::move(input_shape)) {
  status_ = TF_NewStatus();
  try {
    // >>> gpu_options = tf.compat.v1.GPUOptions(allow_growth=True)
    // >>> proto = tf.compat.v1.ConfigProto(gpu_options=gpu_options)
    // >>> list(map(hex, proto.SerializeToString()))
    // ['0x32', '0x2', '0x20', '0x1']
    static const char options_pb[] = {0x32, 0x2, 0x20, 0x1};
    static const char *tags = "serve";
    TF_SessionOptions *options = TF_NewSessionOptions();
    TF_SetConfig(options, options_pb, sizeof(options_pb), status_);
    if (TF_GetCode(status_) != TF_OK) {
      TF_DeleteSessionOptions(options);
      throw std::runtime_error(std::string("session options: ") + TF_Message(status_));
    }
    graph_ = TF_NewGraph();
    session_ = TF_LoadSessionFromSavedModel(
        options, nullptr, export_dir.c_str(), &tags, 1, graph_, nullptr, status_);
    TF_DeleteSessionOptions(options);
    if (TF_GetCode(status_) != TF_OK) {
      throw std::runtime_error("loading " + export_dir + ": " + TF_Message(status_));
    }

    input_oper_ = TF_GraphOperationByName(graph_, input_oper_name.c_str());
    if (input_oper_ == nullptr) {
      throw std::invalid_argument("no operation " + input_oper_name + " in " + export_dir);
    }
    output_oper_ = TF_GraphOperationByName(graph_, output_oper_name.c_str());
    if (output_oper_ == nullptr) {
      throw std::invalid_argument("no operation " + output_oper_name + " in " + export_dir);
    }
  } catch (...) {
    release();
    throw;
  }
}

void TensorflowModel::release() noexcept {
  if (session_) {
    TF_CloseSession(session_, status_);
    TF_DeleteSession(session_, status_);
    session_ = nullptr;
  }
  if (graph_) {
    TF_DeleteGraph(graph_);
    graph_ = nullptr;
  }
  if (status_) {
    TF_DeleteStatus(status_);
    status_ = nullptr;
  }
}

TensorflowModel::~TensorflowModel() {
  release();
}

std::vector<Output> TensorflowModel::run(const std::vector<Sample> &batch) {
  if (batch.empty()) { return {}; }
  const size_t x_dim = shape_size(input_shape_);

  std::vector<int64_t> dims{(int64_t) batch.size()};
  dims.insert(dims.end(), input_shape_.begin(), input_shape_.end());
  TFTensor xs(dims);
  /* copy xs */ {
    for (size_t i = 0; i < batch.size(); i++) {
      const auto &sample = batch[i];
      if (sample.kind_ != SampleKind::NumericArray || sample.size() != x_dim) {
        throw std::invalid_argument(std::string("cannot feed a ") + kind_name(sample.kind_) +
            " sample of " + std::to_string(sample.size()) + " values to a TensorFlow model");
      }
      memcpy(xs.get_data() + x_dim * i, sample.values_.data(), sizeof(float) * x_dim);
    }
  }

  TF_Tensor *input_values[1];
  input_values[0] = xs.raw_;

  TF_Tensor *output_values[1] = {nullptr};

  TF_Output inputs[1];
  inputs[0].oper = input_oper_;
  inputs[0].index = 0;

  TF_Output outputs[1];
  outputs[0].oper = output_oper_;
  outputs[0].index = output_index_;

  TF_SessionRun(
      session_, nullptr,
      // input tensors
      inputs, input_values, 1,
      // output tensors
      outputs, output_values, 1,
      nullptr, 0, nullptr, status_
  );
  if (TF_GetCode(status_) != TF_OK) {
    throw std::runtime_error(std::string("running the model: ") + TF_Message(status_));
  }

  TFTensor ys(output_values[0]);
  const int num_dims = TF_NumDims(ys.raw_);
  check(num_dims >= 1 && TF_Dim(ys.raw_, 0) == (int64_t) batch.size());
  size_t y_dim = 1;
  for (int i = 1; i < num_dims; i++) { y_dim *= TF_Dim(ys.raw_, i); }

  std::vector<Output> rs{};
  rs.reserve(batch.size());
  for (size_t i = 0; i < batch.size(); i++) {
    rs.emplace_back(Eigen::Map<const Output>(ys.get_data() + y_dim * i, y_dim));
  }
  return rs;
}

}
