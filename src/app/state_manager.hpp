/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/format.h>

#include "utils/ctor_limiters.hpp"

namespace tally::app {

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(const std::string &message)
        : std::runtime_error(
              fmt::format("Wrong workflow at {}", message)) {}
  };

  /**
   * Drives components through prepare, launch and shutdown stages. Callbacks
   * of a stage run in registration order; a failed prepare or launch
   * callback turns the application to shutdown.
   */
  class StateManager : NonCopyable, NonMovable {
   public:
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State : uint8_t {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~StateManager() = default;

    virtual void atPrepare(OnPrepare &&cb) = 0;

    virtual void atLaunch(OnLaunch &&cb) = 0;

    virtual void atShutdown(OnShutdown &&cb) = 0;

    /**
     * Registers `prepare()`, `start()` and `stop()` of the entity, those of
     * them it has. `prepare` and `start` may return bool or nothing.
     */
    template <typename Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (requires { entity.prepare(); }) {
        atPrepare([&entity] { return asStageResult([&] {
                                return entity.prepare();
                              }); });
      }
      if constexpr (requires { entity.start(); }) {
        atLaunch([&entity] { return asStageResult([&] {
                               return entity.start();
                             }); });
      }
      if constexpr (requires { entity.stop(); }) {
        atShutdown([&entity] { entity.stop(); });
      }
    }

    /// Runs all stages and blocks until shutdown is done
    virtual void run() = 0;

    /// Requests shutdown; safe to call from any thread
    virtual void shutdown() = 0;

    [[nodiscard]] virtual State state() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;

   private:
    template <typename F>
    static bool asStageResult(F &&f) {
      if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
        std::forward<F>(f)();
        return true;
      } else {
        return static_cast<bool>(std::forward<F>(f)());
      }
    }
  };

}  // namespace tally::app
