/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/presence_feed.hpp"

#include <istream>
#include <variant>

#include <unistd.h>

#include <boost/asio/read_until.hpp>
#include <fmt/format.h>

#include "app/feed_command.hpp"
#include "app/impl/command_processor.hpp"
#include "app/impl/event_loop.hpp"
#include "app/impl/presence_tracker.hpp"
#include "app/state_manager.hpp"

namespace tally::app {

  PresenceFeed::PresenceFeed(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<StateManager> state_manager,
                             qtils::SharedRef<EventLoop> event_loop,
                             qtils::SharedRef<PresenceTracker> tracker,
                             qtils::SharedRef<CommandProcessor> commands)
      : logger_{logsys->getLogger("PresenceFeed", "presence")},
        state_manager_{std::move(state_manager)},
        event_loop_{std::move(event_loop)},
        tracker_{std::move(tracker)},
        commands_{std::move(commands)} {
    state_manager_->takeControl(*this);
  }

  bool PresenceFeed::prepare() {
    auto fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
      SL_CRITICAL(logger_, "Can't duplicate stdin descriptor");
      return false;
    }
    boost::system::error_code ec;
    input_.emplace(event_loop_->ioContext());
    input_->assign(fd, ec);
    if (ec) {
      ::close(fd);
      input_.reset();
      SL_CRITICAL(logger_,
                  "Can't watch stdin for presence events: {}; "
                  "feed events through a pipe or terminal",
                  ec.message());
      return false;
    }
    return true;
  }

  void PresenceFeed::start() {
    event_loop_->post([weak_self{weak_from_this()}] {
      if (auto self = weak_self.lock()) {
        self->readNext();
      }
    });
  }

  void PresenceFeed::stop() {
    input_.reset();
  }

  void PresenceFeed::readNext() {
    if (not input_.has_value()) {
      return;
    }
    boost::asio::async_read_until(
        *input_,
        buffer_,
        '\n',
        [weak_self{weak_from_this()}](const boost::system::error_code &ec,
                                      size_t) {
          auto self = weak_self.lock();
          if (not self) {
            return;
          }
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }

          std::istream stream(&self->buffer_);
          std::string line;
          if (ec) {
            if (ec != boost::asio::error::eof) {
              SL_ERROR(self->logger_,
                       "Presence feed read failed: {}",
                       ec.message());
            } else if (self->buffer_.size() > 0) {
              // Last line without trailing newline
              std::getline(stream, line);
              self->respond(line);
            }
            SL_INFO(self->logger_, "Presence feed closed");
            self->state_manager_->shutdown();
            return;
          }

          std::getline(stream, line);
          self->respond(line);
          self->readNext();
        });
  }

  void PresenceFeed::respond(std::string_view line) {
    if (auto answer = handleLine(line)) {
      fmt::print("{}\n", *answer);
      std::fflush(stdout);
    }
  }

  std::optional<std::string> PresenceFeed::handleLine(std::string_view line) {
    auto command = parseFeedLine(line);
    if (not command.has_value()) {
      auto first = line.find_first_not_of(" \t\r");
      if (first != std::string_view::npos and line[first] != '#') {
        SL_WARN(logger_, "Unknown feed line ignored: '{}'", line);
      }
      return std::nullopt;
    }

    auto report_failure = [&](const outcome::result<void> &res) {
      if (res.has_error()) {
        SL_ERROR(logger_,
                 "Feed line '{}' failed: {}",
                 line,
                 res.error().message());
      }
    };

    return std::visit(
        [&]<typename T>(const T &cmd) -> std::optional<std::string> {
          if constexpr (std::is_same_v<T, feed::Snapshot>) {
            report_failure(tracker_->onSnapshot(cmd.users));
          } else if constexpr (std::is_same_v<T, feed::Join>) {
            report_failure(tracker_->onPresenceChange(cmd.user_id, true));
          } else if constexpr (std::is_same_v<T, feed::Leave>) {
            report_failure(tracker_->onPresenceChange(cmd.user_id, false));
          } else if constexpr (std::is_same_v<T, feed::Today>) {
            return commands_->today();
          } else if constexpr (std::is_same_v<T, feed::ReportNow>) {
            return commands_->reportNow();
          } else if constexpr (std::is_same_v<T, feed::Status>) {
            return commands_->status();
          } else if constexpr (std::is_same_v<T, feed::Quit>) {
            SL_INFO(logger_, "Quit requested");
            state_manager_->shutdown();
          }
          return std::nullopt;
        },
        *command);
  }

}  // namespace tally::app
