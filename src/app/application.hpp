/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utils/ctor_limiters.hpp>

namespace tally::app {

  /// @class Application - tally application interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs tracker until shutdown
    virtual void run() = 0;
  };

}  // namespace tally::app
