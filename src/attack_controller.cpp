#include "attack_controller.hpp"
#include "success_evaluator.hpp"

namespace counterfit {

AttackSession &AttackLifecycleController::active() {
  AttackSession *session = target_.active_attack();
  if (session == nullptr) {
    throw std::logic_error(target_.info_.model_name_ + " has no active attack");
  }
  return *session;
}

void AttackLifecycleController::set_attack_samples(size_t index) {
  set_attack_samples(std::vector<size_t>{index});
}

void AttackLifecycleController::set_attack_samples(const std::vector<size_t> &index) {
  auto &session = active();
  if (session.status_ != AttackStatus::pending) {
    throw std::logic_error("attack " + session.attack_id_ + " is already " +
        status_name(session.status_));
  }
  const auto &info = target_.info_;
  std::vector<Sample> samples{};
  samples.reserve(index.size());
  for (auto i : index) {
    if (i >= target_.X_.size()) {
      throw std::out_of_range("sample index " + std::to_string(i) + " is outside the " +
          std::to_string(target_.X_.size()) + " samples of " + info.model_name_);
    }
    samples.push_back(target_.X_[i]);
    auto &sample = samples.back();
    if (sample.kind_ == SampleKind::NumericArray && !info.input_shape_.empty()) {
      sample.reshape(info.input_shape_);
    }
  }
  session.sample_index_ = index;
  session.samples_ = std::move(samples);
  session.status_ = AttackStatus::pending;
}

void AttackLifecycleController::run_attack(bool logging) {
  auto &session = active();
  if (session.runner_ == nullptr) {
    throw NotImplemented("attack " + session.attack_name_ + " has no runner");
  }
  run_attack(*session.runner_, logging);
}

void AttackLifecycleController::run_attack(AttackRunner &runner, bool logging) {
  auto &session = active();
  if (session.status_ != AttackStatus::pending) {
    throw std::logic_error("attack " + session.attack_id_ + " is already " +
        status_name(session.status_));
  }
  if (session.samples_.empty()) {
    throw std::logic_error("attack " + session.attack_id_ + " has no samples selected");
  }
  // validated before anything reaches the model
  const auto target_classes = session.target_classes();
  const auto &vocabulary = target_.info_.output_classes_;
  for (auto target_class : target_classes) {
    if (target_class >= vocabulary.size()) {
      throw std::out_of_range("target_class " + std::to_string(target_class) +
          " has no label in a vocabulary of " + std::to_string(vocabulary.size()));
    }
  }

  Stopwatch stopwatch;
  stopwatch.start();
  const size_t queries_0 = target_.num_evaluations_.load(std::memory_order_acquire);
  const size_t actual_queries_0 = target_.actual_evaluations_.load(std::memory_order_acquire);

  Query initial = executor_.get_query(session.samples_);
  session.status_ = AttackStatus::running;

  QueryFn query;
  if (logging) {
    query = [this, &session](const std::vector<Sample> &batch) {
      return executor_.submit_batch_with_logging(batch, session);
    };
  } else {
    query = [this](const std::vector<Sample> &batch) {
      return executor_.submit_batch(batch, true);
    };
  }
  AttackRequest request{
      session.samples_, query, session.parameters_, initial.label_, target_classes,
      target_.info_, *target_.label_deriver_
  };
  auto resulting_samples = runner.run(request);
  if (resulting_samples.size() != session.samples_.size()) {
    throw std::logic_error("runner of " + session.attack_id_ + " returned " +
        std::to_string(resulting_samples.size()) + " samples for " +
        std::to_string(session.samples_.size()));
  }

  Query final_query = executor_.get_query(resulting_samples);

  const size_t elapsed = stopwatch.stop();
  const size_t queries =
      target_.num_evaluations_.load(std::memory_order_acquire) - queries_0;
  const size_t actual_queries =
      target_.actual_evaluations_.load(std::memory_order_acquire) - actual_queries_0;
  check(actual_queries <= queries);

  /* commit */ {
    auto &results = session.results_;
    results.initial_ = std::move(initial);
    results.final_ = std::move(final_query);
    results.elapsed_time_ = elapsed / 1e6;
    results.queries_ = queries;
    results.cache_hits_ = queries - actual_queries;
    session.status_ = AttackStatus::completed;
  }
  logi("attack %s (%s) completed: queries=%lu cache_hits=%lu elapsed=%.3fs",
       session.attack_name_.c_str(), session.attack_id_.c_str(),
       session.results_.queries_, session.results_.cache_hits_, session.results_.elapsed_time_);
}

std::vector<bool> AttackLifecycleController::check_attack_success() {
  return is_success(active(), target_.info_.output_classes_);
}

}
