/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "tracking/types.hpp"

namespace tally::clock {
  class SystemClock;
}  // namespace tally::clock

namespace tally::tracking {
  class SessionEngine;
}  // namespace tally::tracking

namespace tally::app {
  class Configuration;
  class EventLoop;
  class StateManager;

  /**
   * Turns presence events into session engine calls, stamped with the clock
   * at receipt. Until the first snapshot of present users arrives the tracker
   * is not ready: joins and leaves are dropped, since only the snapshot tells
   * which stored sessions are still real.
   *
   * All methods except `start` must run on the event loop.
   */
  class PresenceTracker
      : public std::enable_shared_from_this<PresenceTracker> {
   public:
    PresenceTracker(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<StateManager> state_manager,
                    qtils::SharedRef<EventLoop> event_loop,
                    qtils::SharedRef<clock::SystemClock> clock,
                    qtils::SharedRef<tracking::SessionEngine> session_engine);

    /// Applies the snapshot given in configuration, if any
    void start();

    /// Reseeds open sessions from the users present right now
    outcome::result<void> onSnapshot(const std::vector<tracking::UserId> &users);

    /// Opens or closes the session of the user; ignored while not ready
    outcome::result<void> onPresenceChange(const tracking::UserId &user_id,
                                           bool joined);

    bool isReady() const {
      return ready_;
    }

   private:
    log::Logger logger_;
    std::optional<std::vector<tracking::UserId>> initial_snapshot_;
    qtils::SharedRef<EventLoop> event_loop_;
    qtils::SharedRef<clock::SystemClock> clock_;
    qtils::SharedRef<tracking::SessionEngine> session_engine_;
    bool ready_ = false;
  };

}  // namespace tally::app
