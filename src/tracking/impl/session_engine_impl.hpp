/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "tracking/local_calendar.hpp"
#include "tracking/presence_store.hpp"
#include "tracking/session_engine.hpp"

namespace tally::tracking {

  class SessionEngineImpl final : public SessionEngine {
   public:
    SessionEngineImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      qtils::SharedRef<PresenceStore> store,
                      qtils::SharedRef<LocalCalendar> calendar);

    outcome::result<bool> startSession(const UserId &user_id,
                                       Instant started_at) override;

    outcome::result<uint64_t> endSession(const UserId &user_id,
                                         Instant ended_at) override;

    outcome::result<uint64_t> accumulateInterval(const UserId &user_id,
                                                 Instant start,
                                                 Instant end) override;

    outcome::result<size_t> rolloverOpenSessions(Instant midnight) override;

    outcome::result<void> reseedSessions(const std::vector<UserId> &user_ids,
                                         Instant started_at) override;

   private:
    /// Credits [start, end) and reopens the session at `reopened_at` or
    /// removes it, in one store write
    outcome::result<uint64_t> closeInterval(const UserId &user_id,
                                            Instant start,
                                            Instant end,
                                            std::optional<Instant> reopened_at);

    log::Logger logger_;
    qtils::SharedRef<PresenceStore> store_;
    qtils::SharedRef<LocalCalendar> calendar_;
  };

}  // namespace tally::tracking
