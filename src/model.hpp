#ifndef COUNTERFIT_MODEL_HPP
#define COUNTERFIT_MODEL_HPP

#include "sample.hpp"

namespace counterfit {

// Black-box prediction function. One call per batch; outputs come back in input order.
// Must be deterministic for bit-exact inputs.
struct Model {
  virtual std::vector<Output> run(const std::vector<Sample> &batch) = 0;
  virtual ~Model() {}
};

struct FunctionModel : public Model {
  using function_type = std::function<std::vector<Output>(const std::vector<Sample> &)>;

  function_type fn_;

  explicit FunctionModel(function_type fn) : fn_(std::move(fn)) {}

  std::vector<Output> run(const std::vector<Sample> &batch) override { return fn_(batch); }
};

}

#endif //COUNTERFIT_MODEL_HPP
