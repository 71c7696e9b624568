#ifndef COUNTERFIT_ATTACK_CONTROLLER_HPP
#define COUNTERFIT_ATTACK_CONTROLLER_HPP

#include "target.hpp"
#include "query_executor.hpp"
#include "attack_runner.hpp"

namespace counterfit {

// Drives the active attack of a target through its lifecycle:
//
//   set_attack_samples()            pending
//   run_attack():  initial probe    running
//                  runner
//                  final probe      completed
//
// A session runs at most once. If the runner throws, the exception propagates, the session stays
// running and none of its results are committed.
struct AttackLifecycleController {
  TargetContext &target_;
  QueryExecutor executor_;

  explicit AttackLifecycleController(TargetContext &target) : target_(target), executor_(target) {}

  void set_attack_samples(size_t index);
  void set_attack_samples(const std::vector<size_t> &index);

  // Uses the runner registered with the active attack.
  void run_attack(bool logging = false);
  void run_attack(AttackRunner &runner, bool logging = false);

  std::vector<bool> check_attack_success();

 private:
  AttackSession &active();
};

}

#endif //COUNTERFIT_ATTACK_CONTROLLER_HPP
