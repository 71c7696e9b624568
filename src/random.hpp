#ifndef COUNTERFIT_RANDOM_HPP
#define COUNTERFIT_RANDOM_HPP

#include "prelude.hpp"

#define counterfit_clip(x, lo, hi) (x).cwiseMax(lo).cwiseMin(hi)
#define counterfit_fill_randn(x) \
  do { \
    size_t __rows = (x).rows(); \
    for (size_t __i = 0; __i < __rows; __i++) { \
      (x)(__i) = ::counterfit::_normal_dist(::counterfit::gen); \
    } \
  } while (0)

namespace counterfit {

thread_local static std::random_device _rd{};
thread_local static std::seed_seq _seed{_rd(), _rd(), _rd(), _rd(), _rd(), _rd(), _rd(), _rd()};
thread_local static std::mt19937 gen(_seed);
thread_local static std::normal_distribution<float> _normal_dist(0, 1);

}

#endif //COUNTERFIT_RANDOM_HPP
