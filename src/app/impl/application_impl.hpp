/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace tally::log {
  class LoggingSystem;
}  // namespace tally::log

namespace tally::app {
  class Configuration;
  class StateManager;
  class PresenceFeed;
  class MidnightScheduler;

  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<Configuration> config,
                    qtils::SharedRef<StateManager> state_manager,
                    qtils::SharedRef<PresenceFeed> presence_feed,
                    qtils::SharedRef<MidnightScheduler> scheduler);

    void run() override;

   private:
    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<PresenceFeed> presence_feed_;
    qtils::SharedRef<MidnightScheduler> scheduler_;
  };

}  // namespace tally::app
