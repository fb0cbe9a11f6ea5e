/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>

#include "log/logger.hpp"

namespace tally {

  /**
   * Soft limit of open file descriptors of this process, or std::nullopt if
   * getrlimit failed (the failure is logged).
   */
  std::optional<size_t> getFdSoftLimit(const log::Logger &logger);

}  // namespace tally
