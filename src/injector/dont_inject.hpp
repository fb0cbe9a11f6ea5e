/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

// Keeps Boost.DI from constructing T implicitly: the declared constructor is
// never defined, so a stray injection fails at link time. `= delete` would
// break the injector's SFINAE checks.
#define DONT_INJECT(T) explicit T(::tally::injector::DontInjectHelper, ...);

namespace tally::injector {
  struct DontInjectHelper {
    explicit DontInjectHelper() = default;
  };
}  // namespace tally::injector
