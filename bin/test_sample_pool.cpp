#include "sample_pool.hpp"
#include "test_util.hpp"

#include <H5Cpp.h>

using namespace counterfit;

static const std::string FILE_NAME = "/tmp/counterfit_test_" + std::to_string(getpid()) + ".h5";

// images: uint8 [3, 2, 2], values 0..11
// features: float [4, 3], values 0.5 * k
void write_fixture() {
  H5::H5File file(FILE_NAME, H5F_ACC_TRUNC);
  /* images */ {
    hsize_t dims[3] = {3, 2, 2};
    H5::DataSpace space(3, dims);
    H5::DataSet dataset = file.createDataSet("images", H5::PredType::NATIVE_UINT8, space);
    uint8_t data[12];
    for (int k = 0; k < 12; k++) { data[k] = k; }
    dataset.write(data, H5::PredType::NATIVE_UINT8);
  }
  /* features */ {
    hsize_t dims[2] = {4, 3};
    H5::DataSpace space(2, dims);
    H5::DataSet dataset = file.createDataSet("features", H5::PredType::NATIVE_FLOAT, space);
    float data[12];
    for (int k = 0; k < 12; k++) { data[k] = 0.5f * k; }
    dataset.write(data, H5::PredType::NATIVE_FLOAT);
  }
  /* names */ {
    hsize_t dims[1] = {2};
    H5::DataSpace space(1, dims);
    H5::StrType type(H5::PredType::C_S1, 4);
    H5::DataSet dataset = file.createDataSet("names", type, space);
    const char data[8] = {'a', 'b', 'c', 0, 'd', 'e', 'f', 0};
    dataset.write(data, type);
  }
}

template<typename E>
bool load_throws(const std::string &file_name, const std::string &dataset_name,
                 const std::vector<int64_t> &input_shape = {}) {
  try {
    load_hdf5_samples(file_name, dataset_name, input_shape);
  } catch (const E &) {
    return true;
  }
  return false;
}

void test_shape_from_dataset() {
  auto samples = load_hdf5_samples(FILE_NAME, "images");
  check(samples.size() == 3);
  for (const auto &sample : samples) {
    check(sample.kind_ == SampleKind::NumericArray);
    check(sample.shape_ == std::vector<int64_t>({2, 2}));
  }
  check(samples[1].values_(0) == 4.0f);
  check(samples[2].values_(3) == 11.0f);
}

void test_explicit_shape() {
  auto samples = load_hdf5_samples(FILE_NAME, "features", {3, 1});
  check(samples.size() == 4);
  check(samples[0].shape_ == std::vector<int64_t>({3, 1}));
  check(samples[3].values_(2) == 5.5f);
  check(samples[3].to_json() == nlohmann::json({4.5, 5.0, 5.5}));

  check(load_throws<std::invalid_argument>(FILE_NAME, "features", {2, 2}));
}

void test_errors() {
  check(load_throws<std::invalid_argument>(FILE_NAME, "names"));
  check(load_throws<std::runtime_error>(FILE_NAME, "missing"));
  check(load_throws<std::runtime_error>("/tmp/counterfit_no_such_file.h5", "images"));
}

int main() {
  H5::Exception::dontPrint();
  write_fixture();

  std::cout << "test_shape_from_dataset()\n";
  test_shape_from_dataset();
  std::cout << "test_explicit_shape()\n";
  test_explicit_shape();
  std::cout << "test_errors()\n";
  test_errors();

  std::remove(FILE_NAME.c_str());
  return 0;
}
