/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "report/member_directory.hpp"
#include "report/report_sink.hpp"
#include "tracking/totals_reader.hpp"

namespace tally::app {
  class Configuration;
}

namespace tally::report {

  struct ReportRow {
    tracking::UserId user_id;
    std::string display_name;
    uint64_t seconds = 0;

    bool operator==(const ReportRow &) const = default;
  };

  /**
   * Renders per-day totals and hands them to the report sink.
   */
  class Reporter {
   public:
    Reporter(qtils::SharedRef<log::LoggingSystem> logsys,
             qtils::SharedRef<app::Configuration> config,
             qtils::SharedRef<tracking::TotalsReader> totals_reader,
             qtils::SharedRef<MemberDirectory> members,
             qtils::SharedRef<ReportSink> sink);

    /**
     * Rows of users with positive totals, by seconds descending then display
     * name (case-insensitive).
     */
    outcome::result<std::vector<ReportRow>> buildRowsForDay(
        const tracking::DayKey &day_key,
        bool include_live,
        tracking::Instant now) const;

    /// Report body with a header naming the day and the tracked channel
    std::string buildReportContent(const tracking::DayKey &day_key,
                                   const std::vector<ReportRow> &rows) const;

    /// Today's totals for the `today` command
    static std::string buildTodayContent(const tracking::DayKey &day_key,
                                         const std::vector<ReportRow> &rows);

    /**
     * Builds the report of the day and delivers it.
     * @return error of the totals reader or of the sink
     */
    outcome::result<void> postReport(const tracking::DayKey &day_key,
                                     bool include_live,
                                     tracking::Instant now) const;

   private:
    log::Logger logger_;
    std::string channel_;
    qtils::SharedRef<tracking::TotalsReader> totals_reader_;
    qtils::SharedRef<MemberDirectory> members_;
    qtils::SharedRef<ReportSink> sink_;
  };

}  // namespace tally::report
