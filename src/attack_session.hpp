#ifndef COUNTERFIT_ATTACK_SESSION_HPP
#define COUNTERFIT_ATTACK_SESSION_HPP

#include "sample.hpp"

#define ATTACK_STATUSES \
  X(pending,   0)       \
  X(running,   1)       \
  X(completed, 2)

namespace counterfit {

struct AttackRunner;

enum class AttackStatus : uint8_t {
#define X(name, code) name = code,
  ATTACK_STATUSES
#undef X
};

const char *status_name(AttackStatus status);

// std::nullopt for names that are not a status.
std::optional<AttackStatus> parse_status(const std::string &name);

// One submit-and-label round. Fields follow the order (input, output, label).
struct Query {
  std::vector<Sample> input_{};
  std::vector<Output> output_{};
  std::vector<Label> label_{};

  nlohmann::json to_json() const;
};

// One sample of one real submission, for offline auditing.
struct LogRecord {
  std::string timestamp_{};
  std::string model_id_{};
  std::string attack_name_{};
  std::string attack_id_{};
  nlohmann::json input_{};
  Output output_{};
  Label label_{};

  nlohmann::json to_json() const;
};

struct AttackResults {
  std::optional<Query> initial_{};
  std::optional<Query> final_{};
  // seconds
  double elapsed_time_{0.0};
  size_t queries_{0};
  size_t cache_hits_{0};

  nlohmann::json to_json() const;
};

// State of one attack run. Owned by the target it was registered with.
struct AttackSession {
  std::string attack_name_;
  std::string attack_id_;
  nlohmann::json parameters_;
  std::shared_ptr<AttackRunner> runner_;

  std::vector<size_t> sample_index_{};
  std::vector<Sample> samples_{};
  AttackStatus status_{AttackStatus::pending};
  AttackResults results_{};
  std::vector<LogRecord> log_{};

  AttackSession(std::string attack_name, std::string attack_id,
                nlohmann::json parameters = nlohmann::json::object(),
                std::shared_ptr<AttackRunner> runner = nullptr);

  bool targeted() const;

  // One target class index per selected sample; a scalar "target_class" is broadcast.
  // Empty for untargeted attacks.
  std::vector<size_t> target_classes() const;

  inline void append_log(LogRecord record) { log_.push_back(std::move(record)); }

  nlohmann::json dump() const;
};

}

#endif //COUNTERFIT_ATTACK_SESSION_HPP
