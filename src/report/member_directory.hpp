/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "app/configuration.hpp"
#include "tracking/types.hpp"

namespace tally::report {

  /**
   * Display names of tracked users, from the `members` config section.
   */
  class MemberDirectory {
   public:
    explicit MemberDirectory(qtils::SharedRef<app::Configuration> config)
        : members_(config->members()) {}

    /// Configured name, or "User <id>" for unknown users
    std::string displayName(const tracking::UserId &user_id) const {
      if (auto it = members_.find(user_id); it != members_.end()) {
        return it->second;
      }
      return "User " + user_id;
    }

   private:
    app::Configuration::Members members_;
  };

}  // namespace tally::report
