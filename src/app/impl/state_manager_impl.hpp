/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "app/state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <initializer_list>
#include <mutex>
#include <queue>

#include <qtils/shared_ref.hpp>

#include "utils/ctor_limiters.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog
namespace tally::log {
  class LoggingSystem;
}  // namespace tally::log

namespace tally::app {

  /**
   * StateManager bound to process signals: SIGINT, SIGTERM and SIGQUIT
   * request shutdown, SIGHUP rotates log files.
   */
  class StateManagerImpl  // left non-final on purpose to be accessible in tests
      : Singleton<StateManager>,
        public StateManager,
        public std::enable_shared_from_this<StateManagerImpl> {
   public:
    explicit StateManagerImpl(
        qtils::SharedRef<log::LoggingSystem> logging_system);

    ~StateManagerImpl() override;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override {
      return state_;
    }

   protected:
    void reset();

    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    using SignalHandler = void (*)(int);

    /// Installs `handler` for `signals` with those signals blocked meanwhile
    static void installHandler(std::initializer_list<int> signals,
                               SignalHandler handler);

    /// Restores default handling of `signals` if `enabled` was set
    static void restoreDefault(std::atomic_bool &enabled,
                               std::initializer_list<int> signals);

    static std::weak_ptr<StateManagerImpl> wp_to_myself;

    static std::atomic_bool shutting_down_signals_enabled;
    static void shuttingDownSignalsHandler(int);

    static std::atomic_bool log_rotate_signals_enabled;
    static void logRotateSignalsHandler(int);

    /**
     * Runs queued callbacks of a starting stage while the state stays
     * `stage`, then moves it to `next`. A failed callback switches to
     * ShuttingDown.
     */
    template <typename Callbacks>
    void runStartingStage(Callbacks &callbacks,
                          State from,
                          State stage,
                          State next,
                          const char *name);

    void shutdownRequestWaiting();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<log::LoggingSystem> logging_system_;

    std::atomic<State> state_ = State::Init;

    std::recursive_mutex mutex_;

    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::queue<OnPrepare> prepare_;
    std::queue<OnLaunch> launch_;
    std::queue<OnShutdown> shutdown_;
  };

}  // namespace tally::app
