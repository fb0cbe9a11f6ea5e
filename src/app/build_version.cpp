/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef TALLY_BUILD_VERSION
#define TALLY_BUILD_VERSION "0.0.0-unknown"
#endif

namespace tally {
  const std::string &buildVersion() {
    static const std::string buildVersion(TALLY_BUILD_VERSION);
    return buildVersion;
  }
}  // namespace tally
