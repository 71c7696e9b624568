#include "report_writer.hpp"
#include "query_executor.hpp"
#include "test_util.hpp"

#include <thread>

using namespace counterfit;

static const std::string FILE_NAME = "/tmp/counterfit_report_" + std::to_string(getpid()) + ".jsonl";

std::vector<nlohmann::json> read_lines(const std::string &file_name) {
  std::ifstream is(file_name);
  std::vector<nlohmann::json> records{};
  std::string line{};
  while (std::getline(is, line)) { records.push_back(nlohmann::json::parse(line)); }
  return records;
}

void test_append() {
  /* write */ {
    ReportWriter writer(FILE_NAME);
    writer.append({{"a", 1}});
    writer.append({{"b", "two"}});
    writer.flush();
  }
  auto records = read_lines(FILE_NAME);
  check(records.size() == 2);
  check(records[0]["a"] == 1);
  check(records[1]["b"] == "two");

  // reopening truncates
  /* write */ {
    ReportWriter writer(FILE_NAME);
    writer.append({{"c", true}});
  }
  check(read_lines(FILE_NAME).size() == 1);
}

void test_append_log() {
  CountingModel *model;
  auto target = make_numeric_target(&model);
  auto &session = target->add_attack("noise", "w-1");
  QueryExecutor executor(*target);
  executor.submit_batch_with_logging({target->X_[0], target->X_[1], target->X_[2]}, session);

  /* write */ {
    ReportWriter writer(FILE_NAME);
    writer.append_log(session);
    writer.flush();
  }
  auto records = read_lines(FILE_NAME);
  check(records.size() == 3);
  check(records[1]["attack_id"] == "w-1");
  check(records[1]["model_id"] == "toy");
  check(records[1]["label"] == "dog");
  check(records[2]["output"] == nlohmann::json({0.0, 0.0, 1.0}));
}

void test_concurrent_append() {
  constexpr size_t THREADS = 4;
  constexpr size_t RECORDS = 100;
  /* write */ {
    ReportWriter writer(FILE_NAME);
    std::vector<std::thread> threads{};
    for (size_t t = 0; t < THREADS; t++) {
      threads.emplace_back([&writer, t]() {
        for (size_t k = 0; k < RECORDS; k++) { writer.append({{"thread", t}, {"k", k}}); }
      });
    }
    for (auto &thread : threads) { thread.join(); }
    writer.flush();
  }
  // every line parses, so no two records were interleaved
  check(read_lines(FILE_NAME).size() == THREADS * RECORDS);
}

void test_unwritable() {
  bool thrown = false;
  try {
    ReportWriter writer("/nonexistent-dir/report.jsonl");
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  check(thrown);
}

int main() {
  std::cout << "test_append()\n";
  test_append();
  std::cout << "test_append_log()\n";
  test_append_log();
  std::cout << "test_concurrent_append()\n";
  test_concurrent_append();
  std::cout << "test_unwritable()\n";
  test_unwritable();

  std::remove(FILE_NAME.c_str());
  return 0;
}
