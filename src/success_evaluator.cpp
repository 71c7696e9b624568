#include "success_evaluator.hpp"

namespace counterfit {

std::vector<bool> is_success(const AttackSession &session, const std::vector<Label> &vocabulary) {
  const auto &results = session.results_;
  if (!results.initial_.has_value() || !results.final_.has_value()) {
    throw std::logic_error("attack " + session.attack_id_ + " has no results");
  }
  const auto &old_labels = results.initial_->label_;
  const auto &new_labels = results.final_->label_;
  check(old_labels.size() == new_labels.size());

  std::vector<bool> success(new_labels.size());
  if (session.targeted()) {
    auto target_classes = session.target_classes();
    check(target_classes.size() == new_labels.size());
    for (size_t i = 0; i < new_labels.size(); i++) {
      if (target_classes[i] >= vocabulary.size()) {
        throw std::out_of_range("target_class " + std::to_string(target_classes[i]) +
            " has no label in a vocabulary of " + std::to_string(vocabulary.size()));
      }
      success[i] = new_labels[i] == vocabulary[target_classes[i]];
    }
  } else {
    for (size_t i = 0; i < new_labels.size(); i++) {
      success[i] = new_labels[i] != old_labels[i];
    }
  }
  return success;
}

}
