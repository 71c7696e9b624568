#ifndef COUNTERFIT_TARGET_HPP
#define COUNTERFIT_TARGET_HPP

#include "prelude.hpp"
#include "sample.hpp"
#include "model.hpp"
#include "fingerprint_cache.hpp"
#include "label_deriver.hpp"
#include "attack_session.hpp"

namespace counterfit {

struct TargetInfo {
  std::string model_name_{};
  SampleKind data_kind_{SampleKind::NumericArray};
  // Shape of one sample, without the batch dimension. Ignored for text and byte blobs.
  std::vector<int64_t> input_shape_{};
  // Label vocabulary, indexed by output position.
  std::vector<Label> output_classes_{};
  float clip_min_{0.0};
  float clip_max_{1.0};
};

// Everything that lives as long as one target: the model, its held-out samples, the shared
// fingerprint cache, the query counters and the attacks run against it.
struct TargetContext {
  TargetInfo info_;
  std::unique_ptr<Model> model_;
  std::unique_ptr<LabelDeriver> label_deriver_;
  std::vector<Sample> X_;

  FingerprintCache cache_{};
  // logical submissions
  std::atomic_size_t num_evaluations_{0};
  // submissions that reached the model
  std::atomic_size_t actual_evaluations_{0};

  // Without a label deriver, labels are the arg-max over info.output_classes_.
  TargetContext(TargetInfo info, std::unique_ptr<Model> model, std::vector<Sample> X,
                std::unique_ptr<LabelDeriver> label_deriver = nullptr);
  TargetContext(const TargetContext &) = delete;

  inline std::vector<Label> outputs_to_labels(const std::vector<Output> &outputs) const {
    return label_deriver_->derive_labels(outputs);
  }

  // Registers a new pending attack and makes it the active one.
  AttackSession &add_attack(std::string attack_name, std::string attack_id,
                            nlohmann::json parameters = nlohmann::json::object(),
                            std::shared_ptr<AttackRunner> runner = nullptr);

  inline AttackSession *active_attack() noexcept { return active_attack_; }

  std::vector<AttackSession *> get_attacks();

  // std::nullopt if status is not a known status name.
  std::optional<std::vector<AttackSession *>> get_attacks(const std::string &status);

  // {model_name, attacks: [...]}
  nlohmann::json dump() const;

  // {model_name, attack_name, attack_id, attacks: [{status, results}]}
  nlohmann::json attack_record(const AttackSession &session) const;

 private:
  std::vector<std::unique_ptr<AttackSession>> attacks_{};
  AttackSession *active_attack_{nullptr};
};

}

#endif //COUNTERFIT_TARGET_HPP
