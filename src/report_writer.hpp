#ifndef COUNTERFIT_REPORT_WRITER_HPP
#define COUNTERFIT_REPORT_WRITER_HPP

#include "prelude.hpp"
#include "attack_session.hpp"

namespace counterfit {

// Appends JSON records to a file, one per line. All public methods are thread-safe.
struct ReportWriter {
  explicit ReportWriter(const std::string &filename);
  ReportWriter(const ReportWriter &) = delete;
  ~ReportWriter();

  void append(const nlohmann::json &record);

  // One line per log record of the session.
  void append_log(const AttackSession &session);

  void flush();

 private:
  std::mutex mutex_{};
  std::ofstream os_{};
};

}

#endif //COUNTERFIT_REPORT_WRITER_HPP
