/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>

#include "storage/face/batch_writeable.hpp"
#include "storage/face/iterable.hpp"
#include "storage/face/mergeable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace tally::storage::face {

  /**
   * @brief Key-value map with reads, writes, merges, cursors and batches.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>,
                          Iterable<K, V>,
                          Writeable<K, V>,
                          Mergeable<K, V>,
                          BatchWriteable<K, V> {
    /**
     * @return approximate memory used by the map, if known
     */
    [[nodiscard]] virtual std::optional<size_t> byteSizeHint() const {
      return std::nullopt;
    }
  };

}  // namespace tally::storage::face
