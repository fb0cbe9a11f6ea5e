/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <unistd.h>

#include "app/configuration.hpp"
#include "app/impl/midnight_scheduler.hpp"
#include "app/impl/presence_feed.hpp"
#include "app/state_manager.hpp"
#include "log/logger.hpp"

namespace tally::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<PresenceFeed> presence_feed,
      qtils::SharedRef<MidnightScheduler> scheduler)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        state_manager_(std::move(state_manager)),
        presence_feed_(std::move(presence_feed)),
        scheduler_(std::move(scheduler)) {}

  void ApplicationImpl::run() {
    logger_->info("Start as tally version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());
    logger_->info("Tracking channel #{} in timezone {}",
                  app_config_->tracking().channel,
                  app_config_->tracking().timezone);

    state_manager_->run();
  }

}  // namespace tally::app
