/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/impl/totals_reader_impl.hpp"

#include "tracking/interval_splitter.hpp"

namespace tally::tracking {

  TotalsReaderImpl::TotalsReaderImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<PresenceStore> store,
      qtils::SharedRef<LocalCalendar> calendar)
      : logger_(logsys->getLogger("TotalsReader", "totals")),
        store_(std::move(store)),
        calendar_(std::move(calendar)) {}

  outcome::result<Totals> TotalsReaderImpl::getTotalsForDay(
      const DayKey &day_key, bool include_live, Instant now) const {
    OUTCOME_TRY(LocalCalendar::parseDayKey(day_key));

    Totals totals;
    OUTCOME_TRY(rows, store_->listDailyTotals(day_key));
    for (auto &row : rows) {
      totals[row.user_id] = row.seconds;
    }
    if (not include_live) {
      return totals;
    }

    OUTCOME_TRY(sessions, store_->listOpenSessions());
    for (const auto &session : sessions) {
      OUTCOME_TRY(chunks,
                  splitInterval(session.started_at, now, calendar_->zone()));
      for (const auto &chunk : chunks) {
        if (chunk.day_key == day_key) {
          totals[session.user_id] += chunk.seconds;
        }
      }
    }
    SL_TRACE(logger_,
             "Totals of {} with live time of {} open sessions: {} users",
             day_key,
             sessions.size(),
             totals.size());
    return totals;
  }

}  // namespace tally::tracking
