#ifndef COUNTERFIT_PRELUDE_HPP
#define COUNTERFIT_PRELUDE_HPP

extern "C" {
#include <unistd.h>
};

#include <cstdio>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <memory>
#include <vector>
#include <tuple>
#include <exception>
#include <stdexcept>
#include <chrono>
#include <mutex>
#include <functional>
#include <experimental/source_location>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <optional>
#include <random>
#include <unordered_map>

#include <Eigen/Dense>

namespace counterfit {

inline void bug(
    const std::experimental::source_location &loc = std::experimental::source_location::current()) {
  std::ostringstream os{};
  os << loc.file_name() << ":" << loc.line() << ":" << loc.function_name();
  throw std::logic_error(os.str());
}

inline void check(bool flag,
                  const std::experimental::source_location &loc = std::experimental::source_location::current()) {
  if (!flag) {
    bug(loc);
  }
}

// Raised when the lifecycle is driven without a concrete attack runner.
struct NotImplemented : public std::logic_error {
  explicit NotImplemented(const std::string &what) : std::logic_error(what) {}
};

struct Stopwatch {
  std::chrono::time_point<std::chrono::high_resolution_clock> start_{};

  Stopwatch() {}

  inline void start() {
    start_ = std::chrono::high_resolution_clock::now();
  }

  inline size_t stop() {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
  }
};

template<typename ... Args>
inline void logi(const std::string msg, Args ... args) {
  auto fmt = "[I] " + std::string(msg) + "\n";
  fprintf(stdout, fmt.c_str(), args ...);
}

inline void logi(const std::string msg) {
  auto fmt = "[I] " + std::string(msg) + "\n";
  std::cout << fmt;
}

template<typename ... Args>
inline void logw(const std::string msg, Args ... args) {
  auto fmt = "[W] " + std::string(msg) + "\n";
  fprintf(stdout, fmt.c_str(), args ...);
}

inline void logw(const std::string msg) {
  auto fmt = "[W] " + std::string(msg) + "\n";
  std::cout << fmt;
}

}

#endif //COUNTERFIT_PRELUDE_HPP
