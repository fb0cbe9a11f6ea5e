/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/writeable.hpp"

namespace tally::storage::face {

  /**
   * @brief Collects puts and removes and applies all of them at once.
   *
   * Nothing reaches the underlying storage before commit(). After commit the
   * batch may be cleared and reused.
   */
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    /**
     * @brief Applies accumulated operations atomically.
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Drops accumulated operations.
     */
    virtual void clear() = 0;
  };

}  // namespace tally::storage::face
