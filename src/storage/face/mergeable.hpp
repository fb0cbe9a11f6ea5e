/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace tally::storage::face {

  /**
   * @brief A mixin for maps that combine a stored value with an operand
   * inside the storage engine.
   *
   * The combination rule belongs to the map (e.g. counter addition). Merges
   * to the same key commute, so concurrent writers never lose an update to a
   * read-modify-write race.
   */
  template <typename K, typename V>
  struct Mergeable {
    virtual ~Mergeable() = default;

    /**
     * @brief Merges `operand` into the value stored by `key`. An absent value
     * is merged as if it were the identity of the rule.
     * @return StorageError::NOT_SUPPORTED if the map has no merge rule
     */
    virtual outcome::result<void> merge(const View<K> &key,
                                        OwnedOrView<V> &&operand) = 0;
  };

}  // namespace tally::storage::face
