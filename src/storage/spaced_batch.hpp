/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"
#include "storage/spaces.hpp"

namespace tally::storage {

  /**
   * @brief Write batch spanning several spaces.
   *
   * Operations are collected and reach the storage on commit(), all of them
   * or none.
   */
  class SpacedBatch {
   public:
    virtual ~SpacedBatch() = default;

    virtual outcome::result<void> put(Space space,
                                      const ByteView &key,
                                      ByteVecOrView &&value) = 0;

    /// Needs a merge rule configured for the space
    virtual outcome::result<void> merge(Space space,
                                        const ByteView &key,
                                        ByteVecOrView &&operand) = 0;

    virtual outcome::result<void> remove(Space space, const ByteView &key) = 0;

    virtual outcome::result<void> commit() = 0;

    virtual void clear() = 0;
  };

}  // namespace tally::storage
