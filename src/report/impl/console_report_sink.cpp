/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "report/impl/console_report_sink.hpp"

#include <system_error>

#include <fmt/format.h>

namespace tally::report {

  ConsoleReportSink::ConsoleReportSink(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_(logsys->getLogger("Report", "report")), stream_(stdout) {}

  outcome::result<void> ConsoleReportSink::deliver(std::string_view content) {
    SL_INFO(logger_, "Report:\n{}", content);
    fmt::print(stream_, "{}\n", content);
    if (std::fflush(stream_) != 0 or std::ferror(stream_) != 0) {
      SL_ERROR(logger_, "Can't write report to output stream");
      return std::make_error_code(std::errc::io_error);
    }
    return outcome::success();
  }

}  // namespace tally::report
