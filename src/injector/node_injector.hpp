/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace tally::log {
  class LoggingSystem;
}  // namespace tally::log

namespace tally::app {
  class Configuration;
  class Application;
}  // namespace tally::app

namespace tally::injector {

  /**
   * Dependency injector of the tracker. Provides all components required by
   * the tally application.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace tally::injector
