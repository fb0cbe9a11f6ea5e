/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <boost/asio/steady_timer.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"

namespace tally::clock {
  class SystemClock;
}  // namespace tally::clock

namespace tally::tracking {
  class LocalCalendar;
  class PresenceStore;
  class SessionEngine;
}  // namespace tally::tracking

namespace tally::report {
  class Reporter;
}  // namespace tally::report

namespace tally::app {
  class Configuration;
  class EventLoop;
  class PresenceTracker;
  class StateManager;

  /**
   * Closes each local day. Ticks on the event loop; during the first minute
   * after a local midnight it rolls open sessions over to the new day and
   * posts the report of the finished day, once per day.
   */
  class MidnightScheduler
      : public std::enable_shared_from_this<MidnightScheduler> {
   public:
    /// Window after local midnight in which the day is closed
    static constexpr std::chrono::minutes kWindow{1};

    MidnightScheduler(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<Configuration> config,
        qtils::SharedRef<StateManager> state_manager,
        qtils::SharedRef<EventLoop> event_loop,
        qtils::SharedRef<clock::SystemClock> clock,
        qtils::SharedRef<tracking::LocalCalendar> calendar,
        qtils::SharedRef<tracking::SessionEngine> session_engine,
        qtils::SharedRef<tracking::PresenceStore> store,
        qtils::SharedRef<PresenceTracker> tracker,
        qtils::SharedRef<report::Reporter> reporter);

    void start();
    void stop();

    /**
     * One scheduler tick. The finished day is marked done only after its
     * report is delivered, so a failed delivery is retried by later ticks
     * of the same window.
     * @return true if a day was closed by this call
     */
    outcome::result<bool> checkMidnight();

   private:
    void scheduleTick();

    log::Logger logger_;
    std::chrono::seconds tick_interval_;
    qtils::SharedRef<EventLoop> event_loop_;
    qtils::SharedRef<clock::SystemClock> clock_;
    qtils::SharedRef<tracking::LocalCalendar> calendar_;
    qtils::SharedRef<tracking::SessionEngine> session_engine_;
    qtils::SharedRef<tracking::PresenceStore> store_;
    qtils::SharedRef<PresenceTracker> tracker_;
    qtils::SharedRef<report::Reporter> reporter_;
    std::optional<boost::asio::steady_timer> timer_;
    std::chrono::steady_clock::time_point next_tick_;
  };

}  // namespace tally::app
