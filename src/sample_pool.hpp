#ifndef COUNTERFIT_SAMPLE_POOL_HPP
#define COUNTERFIT_SAMPLE_POOL_HPP

#include "sample.hpp"

namespace counterfit {

// Reads held-out numeric samples from an HDF5 dataset. The first dimension of the dataset is the
// sample count; integer and float datasets are both converted to float. If input_shape is empty the
// remaining dimensions of the dataset are used as the sample shape.
std::vector<Sample> load_hdf5_samples(const std::string &file_name,
                                      const std::string &dataset_name,
                                      const std::vector<int64_t> &input_shape = {});

}

#endif //COUNTERFIT_SAMPLE_POOL_HPP
