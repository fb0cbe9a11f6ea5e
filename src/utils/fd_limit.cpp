/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/fd_limit.hpp"

#include <cerrno>
#include <cstring>

#include <sys/resource.h>

namespace tally {

  std::optional<size_t> getFdSoftLimit(const log::Logger &logger) {
    rlimit r{};
    if (getrlimit(RLIMIT_NOFILE, &r) != 0) {
      SL_WARN(logger,
              "getrlimit(RLIMIT_NOFILE) failed: errno={} {}",
              errno,
              strerror(errno));
      return std::nullopt;
    }
    if (r.rlim_cur == RLIM_INFINITY) {
      SL_VERBOSE(logger, "Open files limit: unlimited");
    } else {
      SL_VERBOSE(logger, "Open files limit: {}", r.rlim_cur);
    }
    return r.rlim_cur;
  }

}  // namespace tally
