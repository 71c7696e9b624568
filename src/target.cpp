#include "target.hpp"

namespace counterfit {

TargetContext::TargetContext(TargetInfo info, std::unique_ptr<Model> model, std::vector<Sample> X,
                             std::unique_ptr<LabelDeriver> label_deriver)
    : info_(std::move(info)), model_(std::move(model)),
      label_deriver_(std::move(label_deriver)), X_(std::move(X)) {
  check(model_ != nullptr);
  if (label_deriver_ == nullptr) {
    label_deriver_ = std::make_unique<ArgmaxLabelDeriver>(info_.output_classes_);
  }
  for (size_t i = 0; i < X_.size(); i++) {
    if (X_[i].kind_ != info_.data_kind_) {
      throw std::invalid_argument("sample " + std::to_string(i) + " of " + info_.model_name_ +
          " is " + kind_name(X_[i].kind_) + ", expected " + kind_name(info_.data_kind_));
    }
  }
}

AttackSession &TargetContext::add_attack(std::string attack_name, std::string attack_id,
                                         nlohmann::json parameters,
                                         std::shared_ptr<AttackRunner> runner) {
  for (const auto &attack : attacks_) {
    if (attack->attack_id_ == attack_id) {
      throw std::invalid_argument("attack id " + attack_id + " already exists");
    }
  }
  attacks_.push_back(std::make_unique<AttackSession>(
      std::move(attack_name), std::move(attack_id), std::move(parameters), std::move(runner)));
  active_attack_ = attacks_.back().get();
  return *active_attack_;
}

std::vector<AttackSession *> TargetContext::get_attacks() {
  std::vector<AttackSession *> attacks{};
  for (auto &attack : attacks_) { attacks.push_back(attack.get()); }
  return attacks;
}

std::optional<std::vector<AttackSession *>> TargetContext::get_attacks(const std::string &status) {
  auto parsed = parse_status(status);
  if (!parsed.has_value()) {
    logw("%s not understood", status.c_str());
    return std::nullopt;
  }
  std::vector<AttackSession *> attacks{};
  for (auto &attack : attacks_) {
    if (attack->status_ == parsed.value()) { attacks.push_back(attack.get()); }
  }
  return attacks;
}

nlohmann::json TargetContext::dump() const {
  nlohmann::json attacks = nlohmann::json::array();
  for (const auto &attack : attacks_) { attacks.push_back(attack->dump()); }
  return {{"model_name", info_.model_name_}, {"attacks", attacks}};
}

nlohmann::json TargetContext::attack_record(const AttackSession &session) const {
  nlohmann::json attack = {
      {"status", status_name(session.status_)},
      {"results", session.results_.to_json()},
  };
  return {
      {"model_name", info_.model_name_},
      {"attack_name", session.attack_name_},
      {"attack_id", session.attack_id_},
      {"attacks", nlohmann::json::array({attack})},
  };
}

}
