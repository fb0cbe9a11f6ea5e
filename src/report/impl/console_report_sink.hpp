/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdio>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "report/report_sink.hpp"

namespace tally::report {

  /**
   * Writes reports to the `report` log group and to standard output.
   */
  class ConsoleReportSink final : public ReportSink {
   public:
    explicit ConsoleReportSink(qtils::SharedRef<log::LoggingSystem> logsys);

    outcome::result<void> deliver(std::string_view content) override;

   private:
    log::Logger logger_;
    std::FILE *stream_;
  };

}  // namespace tally::report
