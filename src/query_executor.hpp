#ifndef COUNTERFIT_QUERY_EXECUTOR_HPP
#define COUNTERFIT_QUERY_EXECUTOR_HPP

#include "target.hpp"

namespace counterfit {

// Deduplicated, counted access to the target's model.
//
// Every submit_batch issues at most one model call: cache misses are gathered, in their original
// order, into a single miss batch. The counters of the target advance on every call:
// num_evaluations_ by the batch size, actual_evaluations_ by what reached the model.
struct QueryExecutor {
  TargetContext &target_;

  explicit QueryExecutor(TargetContext &target) : target_(target) {}

  std::vector<Output> submit_batch(const std::vector<Sample> &inputs, bool use_cache = true);

  // Uncached submission that appends one log record per input to the session.
  std::vector<Output> submit_batch_with_logging(const std::vector<Sample> &inputs,
                                                AttackSession &session);

  // Submits a batch and labels it.
  Query get_query(const std::vector<Sample> &batch, bool use_cache = true);

 private:
  std::vector<Output> submit(const std::vector<Sample> &inputs);
  std::vector<Output> call_model(const std::vector<Sample> &batch);
};

// e.g. "Mon, 19 Oct 2026 08:15:00 GMT"
std::string utc_timestamp();

}

#endif //COUNTERFIT_QUERY_EXECUTOR_HPP
