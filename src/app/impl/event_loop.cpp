/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/event_loop.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <soralog/util.hpp>

#include "app/state_manager.hpp"

namespace tally::app {

  EventLoop::EventLoop(qtils::SharedRef<log::LoggingSystem> logsys,
                       qtils::SharedRef<StateManager> state_manager)
      : logger_{logsys->getLogger("EventLoop", "application")},
        io_context_{std::make_shared<boost::asio::io_context>()} {
    state_manager->takeControl(*this);
  }

  EventLoop::~EventLoop() {
    stop();
  }

  void EventLoop::start() {
    io_thread_.emplace([io_context{io_context_}] {
      soralog::util::setThreadName("events");
      auto work_guard = boost::asio::make_work_guard(*io_context);
      io_context->run();
    });
    SL_DEBUG(logger_, "Event loop started");
  }

  void EventLoop::stop() {
    if (io_thread_.has_value()) {
      io_context_->stop();
      io_thread_->join();
      io_thread_.reset();
      SL_DEBUG(logger_, "Event loop stopped");
    }
  }

}  // namespace tally::app
