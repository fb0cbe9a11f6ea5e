/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"

namespace tally::app {
  class StateManager;

  /**
   * The single thread every session mutation and scheduler tick runs on.
   * Handlers posted here never run concurrently with each other.
   */
  class EventLoop {
   public:
    EventLoop(qtils::SharedRef<log::LoggingSystem> logsys,
              qtils::SharedRef<StateManager> state_manager);
    ~EventLoop();

    void start();
    void stop();

    boost::asio::io_context &ioContext() {
      return *io_context_;
    }

    template <typename F>
    void post(F &&f) {
      boost::asio::post(*io_context_, std::forward<F>(f));
    }

   private:
    log::Logger logger_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<std::thread> io_thread_;
  };

}  // namespace tally::app
