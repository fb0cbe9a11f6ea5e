/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/presence_tracker.hpp"

#include "app/configuration.hpp"
#include "app/impl/event_loop.hpp"
#include "app/state_manager.hpp"
#include "clock/clock.hpp"
#include "tracking/session_engine.hpp"

namespace tally::app {

  PresenceTracker::PresenceTracker(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<EventLoop> event_loop,
      qtils::SharedRef<clock::SystemClock> clock,
      qtils::SharedRef<tracking::SessionEngine> session_engine)
      : logger_{logsys->getLogger("PresenceTracker", "presence")},
        initial_snapshot_{config->tracking().present},
        event_loop_{std::move(event_loop)},
        clock_{std::move(clock)},
        session_engine_{std::move(session_engine)} {
    state_manager->takeControl(*this);
  }

  void PresenceTracker::start() {
    if (not initial_snapshot_.has_value()) {
      SL_INFO(logger_, "Waiting for snapshot of present users");
      return;
    }
    event_loop_->post([weak_self{weak_from_this()},
                       users{std::move(*initial_snapshot_)}] {
      auto self = weak_self.lock();
      if (not self) {
        return;
      }
      if (auto res = self->onSnapshot(users); res.has_error()) {
        SL_ERROR(self->logger_,
                 "Can't apply initial snapshot: {}",
                 res.error().message());
      }
    });
    initial_snapshot_.reset();
  }

  outcome::result<void> PresenceTracker::onSnapshot(
      const std::vector<tracking::UserId> &users) {
    auto now = clock_->nowInstant();
    OUTCOME_TRY(session_engine_->reseedSessions(users, now));
    if (not ready_) {
      ready_ = true;
      SL_INFO(logger_, "Tracker is ready");
    }
    SL_INFO(logger_, "Reseeded open sessions for {} active users", users.size());
    return outcome::success();
  }

  outcome::result<void> PresenceTracker::onPresenceChange(
      const tracking::UserId &user_id, bool joined) {
    if (not ready_) {
      SL_DEBUG(logger_,
               "Presence change of user {} before snapshot is ignored",
               user_id);
      return outcome::success();
    }
    auto now = clock_->nowInstant();
    if (joined) {
      OUTCOME_TRY(started, session_engine_->startSession(user_id, now));
      if (started) {
        SL_INFO(logger_, "Session started: user={}", user_id);
      }
      return outcome::success();
    }
    OUTCOME_TRY(seconds, session_engine_->endSession(user_id, now));
    SL_INFO(logger_, "Session ended: user={} tracked={}s", user_id, seconds);
    return outcome::success();
  }

}  // namespace tally::app
