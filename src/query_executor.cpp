#include "query_executor.hpp"

#include <ctime>
#include <iomanip>
#include <locale>

namespace counterfit {

std::string utc_timestamp() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream os{};
  os.imbue(std::locale::classic());
  os << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
  return os.str();
}

std::vector<Output> QueryExecutor::call_model(const std::vector<Sample> &batch) {
  auto outputs = target_.model_->run(batch);
  if (outputs.size() != batch.size()) {
    std::ostringstream os{};
    os << target_.info_.model_name_ << " returned " << outputs.size() << " outputs for "
       << batch.size() << " inputs";
    throw std::runtime_error(os.str());
  }
  return outputs;
}

std::vector<Output> QueryExecutor::submit(const std::vector<Sample> &inputs) {
  target_.num_evaluations_.fetch_add(inputs.size(), std::memory_order_seq_cst);
  target_.actual_evaluations_.fetch_add(inputs.size(), std::memory_order_seq_cst);
  return call_model(inputs);
}

std::vector<Output> QueryExecutor::submit_batch(const std::vector<Sample> &inputs,
                                                bool use_cache) {
  if (!use_cache) { return submit(inputs); }

  target_.num_evaluations_.fetch_add(inputs.size(), std::memory_order_seq_cst);
  std::vector<Output> outputs(inputs.size());
  std::vector<Sample> miss_batch{};
  std::vector<size_t> miss_idxes{};
  std::vector<FingerprintKey> miss_keys{};
  /* look up */ {
    for (size_t i = 0; i < inputs.size(); i++) {
      auto key = inputs[i].fingerprint();
      auto hit = target_.cache_.get(key);
      if (hit.has_value()) {
        outputs[i] = std::move(hit.value());
      } else {
        miss_batch.push_back(inputs[i]);
        miss_idxes.push_back(i);
        miss_keys.push_back(std::move(key));
      }
    }
  }
  // everything was cached
  if (miss_batch.empty()) { return outputs; }

  /* one model call for all misses */ {
    target_.actual_evaluations_.fetch_add(miss_batch.size(), std::memory_order_seq_cst);
    auto results = call_model(miss_batch);
    for (size_t j = 0; j < results.size(); j++) {
      target_.cache_.put(miss_keys[j], results[j]);
      outputs[miss_idxes[j]] = std::move(results[j]);
    }
  }
  return outputs;
}

std::vector<Output> QueryExecutor::submit_batch_with_logging(const std::vector<Sample> &inputs,
                                                             AttackSession &session) {
  auto timestamp = utc_timestamp();
  auto outputs = submit(inputs);
  auto labels = target_.outputs_to_labels(outputs);
  check(labels.size() == outputs.size());
  for (size_t i = 0; i < inputs.size(); i++) {
    LogRecord record{};
    record.timestamp_ = timestamp;
    record.model_id_ = target_.info_.model_name_;
    record.attack_name_ = session.attack_name_;
    record.attack_id_ = session.attack_id_;
    record.input_ = inputs[i].to_json();
    record.output_ = outputs[i];
    record.label_ = labels[i];
    session.append_log(std::move(record));
  }
  return outputs;
}

Query QueryExecutor::get_query(const std::vector<Sample> &batch, bool use_cache) {
  Query query{};
  query.output_ = submit_batch(batch, use_cache);
  query.label_ = target_.outputs_to_labels(query.output_);
  check(query.label_.size() == batch.size());
  query.input_ = batch;
  return query;
}

}
