#include "query_executor.hpp"
#include "test_util.hpp"

using namespace counterfit;

void test_second_identical_input_hits_cache() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  auto a = numeric_sample({1.0f, 0.25f});
  auto b = numeric_sample({1.0f, 0.25f});
  auto ya = executor.submit_batch({a});
  check(model->calls() == 1);
  auto yb = executor.submit_batch({b});
  check(model->calls() == 1);
  check(ya.size() == 1 && yb.size() == 1);
  check((ya[0] == yb[0]).all());
  check(target->num_evaluations_ == 2);
  check(target->actual_evaluations_ == 1);
}

void test_partial_hits_one_miss_batch() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  std::vector<Sample> xs{};
  for (int i = 0; i < 5; i++) { xs.push_back(numeric_sample({(float) (i % 3), 0.1f * i})); }
  // warm up xs[1] and xs[3]
  executor.submit_batch({xs[1], xs[3]});
  check(model->calls() == 1);
  check(model->batch_sizes_[0] == 2);

  auto ys = executor.submit_batch(xs);
  check(model->calls() == 2);
  check(model->batch_sizes_[1] == 3);
  check(ys.size() == 5);
  // outputs are spliced back in input order
  for (int i = 0; i < 5; i++) {
    Eigen::Index label;
    ys[i].maxCoeff(&label);
    check((size_t) label == (size_t) (i % 3));
  }
  check(target->num_evaluations_ == 7);
  check(target->actual_evaluations_ == 5);
}

void test_all_hits_skip_model() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  std::vector<Sample> xs{numeric_sample({0.0f, 1.0f}), numeric_sample({2.0f, 1.0f})};
  executor.submit_batch(xs);
  check(model->calls() == 1);
  executor.submit_batch(xs);
  executor.submit_batch({xs[1], xs[0], xs[1]});
  check(model->calls() == 1);
  check(target->num_evaluations_ == 7);
  check(target->actual_evaluations_ == 2);
}

void test_empty_batch() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  auto ys = executor.submit_batch({});
  check(ys.empty());
  check(model->calls() == 0);
  check(target->num_evaluations_ == 0);
}

void test_without_cache() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  std::vector<Sample> xs{numeric_sample({0.0f, 1.0f}), numeric_sample({1.0f, 1.0f})};
  executor.submit_batch(xs, true);
  executor.submit_batch(xs, false);
  check(model->calls() == 2);
  check(model->batch_sizes_[1] == 2);
  check(target->num_evaluations_ == 4);
  check(target->actual_evaluations_ == 4);
}

void test_counter_invariant() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  for (int round = 0; round < 20; round++) {
    std::vector<Sample> xs{};
    for (int i = 0; i <= round % 4; i++) { xs.push_back(numeric_sample({(float) i, (float) (round % 5)})); }
    executor.submit_batch(xs, round % 3 != 0);
    check(target->actual_evaluations_ <= target->num_evaluations_);
  }
  size_t submitted = 0;
  for (auto size : model->batch_sizes_) { submitted += size; }
  check(submitted == target->actual_evaluations_);
}

void test_duplicates_within_one_batch() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  auto a = numeric_sample({2.0f, 0.0f});
  executor.submit_batch({a, a});
  // the cache is consulted before the batch is sent
  check(model->calls() == 1);
  check(model->batch_sizes_[0] == 2);
  check(target->cache_.size() == 1);
}

void test_logging_forces_submission() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);
  auto &session = target->add_attack("noise", "a-1");

  std::vector<Sample> xs{numeric_sample({1.0f, 0.5f}), numeric_sample({2.0f, 0.5f})};
  executor.submit_batch(xs);
  executor.submit_batch_with_logging(xs, session);
  check(model->calls() == 2);
  check(target->num_evaluations_ == 4);
  check(target->actual_evaluations_ == 4);

  check(session.log_.size() == 2);
  const auto &record = session.log_[1];
  check(record.model_id_ == "toy");
  check(record.attack_name_ == "noise");
  check(record.attack_id_ == "a-1");
  check(record.label_ == "bird");
  check(record.input_ == nlohmann::json({2.0, 0.5}));
  check(record.timestamp_.size() > 4);
  check(record.timestamp_.substr(record.timestamp_.size() - 4) == " GMT");

  auto json = record.to_json();
  for (auto key : {"timestamp", "model_id", "attack_name", "attack_id", "input", "output", "label"}) {
    check(json.contains(key));
  }
}

void test_get_query() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  QueryExecutor executor(*target);

  auto query = executor.get_query({numeric_sample({0.0f, 0.0f}), numeric_sample({1.0f, 0.0f})});
  check(query.label_ == std::vector<Label>({"cat", "dog"}));
  auto json = query.to_json();
  check(json["input"].size() == 2);
  check(json["output"][1] == nlohmann::json({0.0, 1.0, 0.0}));
  check(json["label"][0] == "cat");
}

void test_text_and_bytes() {
  TargetInfo info{};
  info.model_name_ = "strings";
  info.data_kind_ = SampleKind::Text;
  info.output_classes_ = {"neg", "pos"};
  auto owned = std::make_unique<CountingModel>(2);
  auto model = owned.get();
  TargetContext target(info, std::move(owned), {});
  QueryExecutor executor(target);

  auto ys = executor.submit_batch({Sample::text("abc"), Sample::text("ab"), Sample::text("abc")});
  check(model->calls() == 1);
  check(model->batch_sizes_[0] == 3);
  executor.submit_batch({Sample::text("ab"), Sample::blob({'a', 'b'})});
  check(model->calls() == 2);
  check(model->batch_sizes_[1] == 1);
}

void test_short_model_output() {
  TargetInfo info{};
  info.model_name_ = "broken";
  info.output_classes_ = {"a", "b"};
  auto model = std::make_unique<FunctionModel>([](const std::vector<Sample> &) {
    return std::vector<Output>{};
  });
  TargetContext target(info, std::move(model), {});
  QueryExecutor executor(target);
  bool thrown = false;
  try {
    executor.submit_batch({numeric_sample({1.0f})});
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  check(thrown);
  check(target.cache_.size() == 0);
}

int main() {
  std::cout << "test_second_identical_input_hits_cache()\n";
  test_second_identical_input_hits_cache();
  std::cout << "test_partial_hits_one_miss_batch()\n";
  test_partial_hits_one_miss_batch();
  std::cout << "test_all_hits_skip_model()\n";
  test_all_hits_skip_model();
  std::cout << "test_empty_batch()\n";
  test_empty_batch();
  std::cout << "test_without_cache()\n";
  test_without_cache();
  std::cout << "test_counter_invariant()\n";
  test_counter_invariant();
  std::cout << "test_duplicates_within_one_batch()\n";
  test_duplicates_within_one_batch();
  std::cout << "test_logging_forces_submission()\n";
  test_logging_forces_submission();
  std::cout << "test_get_query()\n";
  test_get_query();
  std::cout << "test_text_and_bytes()\n";
  test_text_and_bytes();
  std::cout << "test_short_model_output()\n";
  test_short_model_output();

  return 0;
}
