/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/spaced_batch.hpp"
#include "storage/spaces.hpp"

namespace tally::storage {

  /**
   * @brief Database split into independent key spaces.
   */
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve a pointer to the map representing particular storage space
     * @param space - identifier of required space
     * @return a pointer buffer storage for a space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;

    /**
     * Creates an empty batch whose writes to any spaces are committed
     * atomically
     */
    virtual std::unique_ptr<SpacedBatch> createBatch() = 0;
  };

}  // namespace tally::storage
