/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "report/reporter.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/format.h>

#include "app/configuration.hpp"
#include "report/format.hpp"

namespace tally::report {

  namespace {
    std::string renderRows(std::string head,
                           const std::vector<ReportRow> &rows) {
      for (const auto &row : rows) {
        head += fmt::format("\n- {}: `{}`",
                            row.display_name,
                            formatSeconds(static_cast<int64_t>(row.seconds)));
      }
      return head;
    }
  }  // namespace

  Reporter::Reporter(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<app::Configuration> config,
                     qtils::SharedRef<tracking::TotalsReader> totals_reader,
                     qtils::SharedRef<MemberDirectory> members,
                     qtils::SharedRef<ReportSink> sink)
      : logger_(logsys->getLogger("Reporter", "report")),
        channel_(config->tracking().channel),
        totals_reader_(std::move(totals_reader)),
        members_(std::move(members)),
        sink_(std::move(sink)) {}

  outcome::result<std::vector<ReportRow>> Reporter::buildRowsForDay(
      const tracking::DayKey &day_key,
      bool include_live,
      tracking::Instant now) const {
    OUTCOME_TRY(totals,
                totals_reader_->getTotalsForDay(day_key, include_live, now));

    std::vector<ReportRow> rows;
    for (const auto &[user_id, seconds] : totals) {
      if (seconds == 0) {
        continue;
      }
      rows.push_back(ReportRow{
          .user_id = user_id,
          .display_name = members_->displayName(user_id),
          .seconds = seconds,
      });
    }
    std::ranges::stable_sort(
        rows, [](const ReportRow &lhs, const ReportRow &rhs) {
          if (lhs.seconds != rhs.seconds) {
            return lhs.seconds > rhs.seconds;
          }
          return boost::algorithm::to_lower_copy(lhs.display_name)
               < boost::algorithm::to_lower_copy(rhs.display_name);
        });
    return rows;
  }

  std::string Reporter::buildReportContent(
      const tracking::DayKey &day_key,
      const std::vector<ReportRow> &rows) const {
    auto head = fmt::format(
        "**Daily Presence - {}**\nTracked channel: #{}", day_key, channel_);
    if (rows.empty()) {
      return fmt::format("{}\nNo tracked activity for {}.", head, day_key);
    }
    return renderRows(std::move(head), rows);
  }

  std::string Reporter::buildTodayContent(const tracking::DayKey &day_key,
                                          const std::vector<ReportRow> &rows) {
    if (rows.empty()) {
      return fmt::format("No tracked activity for {}.", day_key);
    }
    return renderRows(fmt::format("Today's totals ({}):", day_key), rows);
  }

  outcome::result<void> Reporter::postReport(const tracking::DayKey &day_key,
                                             bool include_live,
                                             tracking::Instant now) const {
    OUTCOME_TRY(rows, buildRowsForDay(day_key, include_live, now));
    OUTCOME_TRY(sink_->deliver(buildReportContent(day_key, rows)));
    SL_INFO(logger_,
            "Report for {} delivered ({} users{})",
            day_key,
            rows.size(),
            include_live ? ", with live time" : "");
    return outcome::success();
  }

}  // namespace tally::report
