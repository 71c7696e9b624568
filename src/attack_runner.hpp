#ifndef COUNTERFIT_ATTACK_RUNNER_HPP
#define COUNTERFIT_ATTACK_RUNNER_HPP

#include "target.hpp"

namespace counterfit {

// Calls back into the query executor of the running attack.
using QueryFn = std::function<std::vector<Output>(const std::vector<Sample> &)>;

// What an attack runner gets to see. References stay valid for the duration of run().
struct AttackRequest {
  const std::vector<Sample> &samples_;
  const QueryFn &query_;
  const nlohmann::json &parameters_;
  // labels of the initial probe, one per sample
  const std::vector<Label> &initial_labels_;
  // one class index per sample when targeted, empty otherwise
  const std::vector<size_t> &target_classes_;
  const TargetInfo &target_;
  const LabelDeriver &label_deriver_;
};

struct AttackRunner {
  // Returns one perturbed sample per input sample, in the same order.
  virtual std::vector<Sample> run(const AttackRequest &request) {
    (void) request;
    throw NotImplemented("attack runner does not implement run()");
  }

  virtual ~AttackRunner() {}
};

struct FunctionRunner : public AttackRunner {
  using function_type = std::function<std::vector<Sample>(const AttackRequest &)>;

  function_type fn_;

  explicit FunctionRunner(function_type fn) : fn_(std::move(fn)) {}

  std::vector<Sample> run(const AttackRequest &request) override { return fn_(request); }
};

}

#endif //COUNTERFIT_ATTACK_RUNNER_HPP
