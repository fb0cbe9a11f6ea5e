/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/impl/session_engine_impl.hpp"

#include "tracking/iso_instant.hpp"
#include "tracking/interval_splitter.hpp"

namespace tally::tracking {

  SessionEngineImpl::SessionEngineImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<PresenceStore> store,
      qtils::SharedRef<LocalCalendar> calendar)
      : logger_(logsys->getLogger("SessionEngine", "session_engine")),
        store_(std::move(store)),
        calendar_(std::move(calendar)) {}

  outcome::result<bool> SessionEngineImpl::startSession(const UserId &user_id,
                                                        Instant started_at) {
    OUTCOME_TRY(existing, store_->getOpenSession(user_id));
    if (existing.has_value()) {
      SL_DEBUG(logger_,
               "Session of '{}' is already open since {}",
               user_id,
               formatIsoInstant(existing->started_at));
      return false;
    }
    OUTCOME_TRY(store_->upsertOpenSession(user_id, started_at));
    SL_INFO(logger_,
            "Session of '{}' started at {}",
            user_id,
            formatIsoInstant(started_at));
    return true;
  }

  outcome::result<uint64_t> SessionEngineImpl::endSession(
      const UserId &user_id, Instant ended_at) {
    OUTCOME_TRY(session, store_->getOpenSession(user_id));
    if (not session.has_value()) {
      SL_DEBUG(logger_, "No open session of '{}' to end", user_id);
      return 0;
    }
    OUTCOME_TRY(credited,
                closeInterval(
                    user_id, session->started_at, ended_at, std::nullopt));
    SL_INFO(logger_,
            "Session of '{}' ended at {}, {}s credited",
            user_id,
            formatIsoInstant(ended_at),
            credited);
    return credited;
  }

  outcome::result<uint64_t> SessionEngineImpl::accumulateInterval(
      const UserId &user_id, Instant start, Instant end) {
    OUTCOME_TRY(chunks, splitInterval(start, end, calendar_->zone()));
    uint64_t credited = 0;
    for (const auto &chunk : chunks) {
      OUTCOME_TRY(store_->addDailySeconds(
          chunk.day_key, user_id, static_cast<int64_t>(chunk.seconds)));
      SL_TRACE(logger_,
               "{}s of '{}' credited to {}",
               chunk.seconds,
               user_id,
               chunk.day_key);
      credited += chunk.seconds;
    }
    return credited;
  }

  outcome::result<uint64_t> SessionEngineImpl::closeInterval(
      const UserId &user_id,
      Instant start,
      Instant end,
      std::optional<Instant> reopened_at) {
    OUTCOME_TRY(chunks, splitInterval(start, end, calendar_->zone()));
    OUTCOME_TRY(store_->closeInterval(user_id, chunks, reopened_at));
    uint64_t credited = 0;
    for (const auto &chunk : chunks) {
      credited += chunk.seconds;
    }
    return credited;
  }

  outcome::result<size_t> SessionEngineImpl::rolloverOpenSessions(
      Instant midnight) {
    OUTCOME_TRY(sessions, store_->listOpenSessions());
    size_t rolled = 0;
    for (const auto &session : sessions) {
      if (session.started_at >= midnight) {
        continue;
      }
      OUTCOME_TRY(
          credited,
          closeInterval(
              session.user_id, session.started_at, midnight, midnight));
      SL_DEBUG(logger_,
               "Session of '{}' rolled over, {}s credited",
               session.user_id,
               credited);
      ++rolled;
    }
    SL_INFO(logger_,
            "Rolled over {} of {} open sessions at {}",
            rolled,
            sessions.size(),
            formatIsoInstant(midnight));
    return rolled;
  }

  outcome::result<void> SessionEngineImpl::reseedSessions(
      const std::vector<UserId> &user_ids, Instant started_at) {
    OUTCOME_TRY(store_->clearOpenSessions());
    for (const auto &user_id : user_ids) {
      OUTCOME_TRY(store_->upsertOpenSession(user_id, started_at));
    }
    SL_INFO(logger_,
            "Reseeded {} open sessions at {}",
            user_ids.size(),
            formatIsoInstant(started_at));
    return outcome::success();
  }

}  // namespace tally::tracking
