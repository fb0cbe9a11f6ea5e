/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"

namespace tally::app {
  class CommandProcessor;
  class EventLoop;
  class PresenceTracker;
  class StateManager;

  /**
   * Line-oriented input of presence events and commands, read from stdin on
   * the event loop. Command answers are written to stdout. End of input
   * shuts the application down.
   */
  class PresenceFeed : public std::enable_shared_from_this<PresenceFeed> {
   public:
    PresenceFeed(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<StateManager> state_manager,
                 qtils::SharedRef<EventLoop> event_loop,
                 qtils::SharedRef<PresenceTracker> tracker,
                 qtils::SharedRef<CommandProcessor> commands);

    /// Fails if stdin can't be watched (e.g. it is a regular file)
    bool prepare();
    void start();
    void stop();

    /**
     * Executes one feed line.
     * @return answer to print, if the line is a command that has one
     */
    std::optional<std::string> handleLine(std::string_view line);

   private:
    void readNext();
    void respond(std::string_view line);

    log::Logger logger_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<EventLoop> event_loop_;
    qtils::SharedRef<PresenceTracker> tracker_;
    qtils::SharedRef<CommandProcessor> commands_;
    std::optional<boost::asio::posix::stream_descriptor> input_;
    boost::asio::streambuf buffer_;
  };

}  // namespace tally::app
