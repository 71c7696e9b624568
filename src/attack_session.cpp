#include "attack_session.hpp"

namespace {

const char *const status_names[] = {
#define X(name, code) #name,
    ATTACK_STATUSES
#undef X
};

size_t as_class_index(const nlohmann::json &value) {
  if (!value.is_number_integer() || value.get<int64_t>() < 0) {
    throw std::invalid_argument("target_class must be a non-negative integer, got " + value.dump());
  }
  return value.get<size_t>();
}

}

namespace counterfit {

const char *status_name(AttackStatus status) {
  return status_names[static_cast<uint8_t>(status)];
}

std::optional<AttackStatus> parse_status(const std::string &name) {
#define X(status, code) if (name == #status) { return AttackStatus::status; }
  ATTACK_STATUSES
#undef X
  return std::nullopt;
}

nlohmann::json Query::to_json() const {
  nlohmann::json input = nlohmann::json::array();
  for (const auto &sample : input_) { input.push_back(sample.to_json()); }
  nlohmann::json output = nlohmann::json::array();
  for (const auto &row : output_) { output.push_back(output_to_json(row)); }
  return {{"input", input}, {"output", output}, {"label", label_}};
}

nlohmann::json LogRecord::to_json() const {
  return {
      {"timestamp", timestamp_},
      {"model_id", model_id_},
      {"attack_name", attack_name_},
      {"attack_id", attack_id_},
      {"input", input_},
      {"output", output_to_json(output_)},
      {"label", label_},
  };
}

nlohmann::json AttackResults::to_json() const {
  nlohmann::json results = nlohmann::json::object();
  if (initial_.has_value()) { results["initial"] = initial_->to_json(); }
  if (final_.has_value()) {
    results["final"] = final_->to_json();
    results["elapsed_time"] = elapsed_time_;
    results["queries"] = queries_;
    results["cache_hits"] = cache_hits_;
  }
  return results;
}

AttackSession::AttackSession(std::string attack_name, std::string attack_id,
                             nlohmann::json parameters, std::shared_ptr<AttackRunner> runner)
    : attack_name_(std::move(attack_name)), attack_id_(std::move(attack_id)),
      parameters_(std::move(parameters)), runner_(std::move(runner)) {
  if (parameters_.is_null()) { parameters_ = nlohmann::json::object(); }
  if (!parameters_.is_object()) {
    throw std::invalid_argument("attack parameters must be a JSON object");
  }
  auto it = parameters_.find("targeted");
  if (it != parameters_.end() && !it->is_null() && !it->is_boolean() && !it->is_number()) {
    throw std::invalid_argument("targeted must be a boolean or a number, got " + it->dump());
  }
}

bool AttackSession::targeted() const {
  auto it = parameters_.find("targeted");
  if (it == parameters_.end() || it->is_null()) { return false; }
  // numbers count as flags, 0 is false
  if (it->is_number()) { return it->get<double>() != 0.0; }
  return it->get<bool>();
}

std::vector<size_t> AttackSession::target_classes() const {
  if (!targeted()) { return {}; }
  auto it = parameters_.find("target_class");
  if (it == parameters_.end()) {
    throw std::invalid_argument("targeted attack " + attack_id_ + " has no target_class");
  }
  std::vector<size_t> classes{};
  if (it->is_array()) {
    if (it->size() != samples_.size()) {
      throw std::invalid_argument("target_class has " + std::to_string(it->size()) +
          " entries for " + std::to_string(samples_.size()) + " samples");
    }
    for (const auto &value : *it) { classes.push_back(as_class_index(value)); }
  } else {
    classes.assign(samples_.size(), as_class_index(*it));
  }
  return classes;
}

nlohmann::json AttackSession::dump() const {
  return {
      {"attack_name", attack_name_},
      {"attack_id", attack_id_},
      {"sample_index", sample_index_},
      {"parameters", parameters_},
      {"status", status_name(status_)},
      {"results", results_.to_json()},
  };
}

}
