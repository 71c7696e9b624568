#include "sample_pool.hpp"

#include <H5Cpp.h>

namespace counterfit {

std::vector<Sample> load_hdf5_samples(const std::string &file_name,
                                      const std::string &dataset_name,
                                      const std::vector<int64_t> &input_shape) {
  try {
    H5::H5File file(file_name, H5F_ACC_RDONLY);
    H5::DataSet dataset = file.openDataSet(dataset_name);
    H5::DataSpace space = dataset.getSpace();

    auto tc = dataset.getTypeClass();
    if (tc != H5T_INTEGER && tc != H5T_FLOAT) {
      throw std::invalid_argument(dataset_name + " in " + file_name + " is not numeric");
    }
    const int rank = space.getSimpleExtentNdims();
    if (rank < 1) {
      throw std::invalid_argument(dataset_name + " in " + file_name + " is a scalar");
    }
    std::vector<hsize_t> dims(rank);
    space.getSimpleExtentDims(dims.data());
    const size_t n_samples = dims[0];
    const size_t n_points = space.getSimpleExtentNpoints();
    if (n_samples == 0) { return {}; }
    const size_t x_dim = n_points / n_samples;
    check(n_points == n_samples * x_dim);

    std::vector<int64_t> shape = input_shape;
    if (shape.empty()) {
      for (int i = 1; i < rank; i++) { shape.push_back(dims[i]); }
    }
    if (static_cast<size_t>(shape_size(shape)) != x_dim) {
      throw std::invalid_argument(dataset_name + " in " + file_name + " holds samples of " +
          std::to_string(x_dim) + " values, which does not match the input shape");
    }

    std::unique_ptr<float[]> values(new float[n_points]);
    dataset.read(values.get(), H5::PredType::NATIVE_FLOAT);

    std::vector<Sample> samples{};
    samples.reserve(n_samples);
    for (size_t i = 0; i < n_samples; i++) {
      Eigen::Map<const Eigen::Array<float, Eigen::Dynamic, 1>> x(values.get() + i * x_dim, x_dim);
      samples.push_back(Sample::numeric(Eigen::Array<float, Eigen::Dynamic, 1>(x), shape));
    }
    return samples;
  } catch (const H5::Exception &e) {
    throw std::runtime_error("reading " + dataset_name + " from " + file_name + ": " +
        e.getDetailMsg());
  }
}

}
