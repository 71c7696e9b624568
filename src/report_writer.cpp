#include "report_writer.hpp"

namespace counterfit {

ReportWriter::ReportWriter(const std::string &filename) {
  os_.open(filename, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!os_.is_open()) {
    throw std::runtime_error("cannot open " + filename + " for writing");
  }
}

ReportWriter::~ReportWriter() {
  os_.close();
}

void ReportWriter::append(const nlohmann::json &record) {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  os_ << record.dump() << "\n";
}

void ReportWriter::append_log(const AttackSession &session) {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  for (const auto &record : session.log_) { os_ << record.to_json().dump() << "\n"; }
}

void ReportWriter::flush() {
  std::lock_guard<decltype(mutex_)> lock(mutex_);
  os_.flush();
  if (!os_) { throw std::runtime_error("writing report failed"); }
}

}
