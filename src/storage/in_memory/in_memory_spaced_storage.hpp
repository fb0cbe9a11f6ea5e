/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/counter_merge.hpp"
#include "storage/in_memory/in_memory_spaced_batch.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace tally::storage {

  /**
   * @brief SpacedStorage held in memory, for tests.
   *
   * Spaces are created on first access. Space::DailyTotals gets the counter
   * merge rule, same as its RocksDB column family. Batches must not outlive
   * the storage.
   */
  class InMemorySpacedStorage : public storage::SpacedStorage {
   public:
    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      return storageOf(space);
    }

    std::unique_ptr<SpacedBatch> createBatch() override {
      return std::make_unique<InMemorySpacedBatch>(
          [this](Space space) { return storageOf(space); });
    }

   private:
    std::shared_ptr<InMemoryStorage> storageOf(Space space) {
      if (auto it = spaces_.find(space); it != spaces_.end()) {
        return it->second;
      }
      auto storage = space == Space::DailyTotals
                       ? std::make_shared<InMemoryStorage>(mergeCounters)
                       : std::make_shared<InMemoryStorage>();
      return spaces_.emplace(space, std::move(storage)).first->second;
    }

    std::map<Space, std::shared_ptr<InMemoryStorage>> spaces_;
  };

}  // namespace tally::storage
