/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace tally::storage::face {

  /**
   * @brief Bidirectional cursor over a map ordered by key bytes.
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /**
     * @brief Moves to the first entry.
     * @return true if the cursor is valid afterwards
     */
    virtual outcome::result<bool> seekFirst() = 0;

    /**
     * @brief Moves to the first entry whose key is not less than `key`.
     * @return true if the cursor is valid afterwards
     */
    virtual outcome::result<bool> seek(const View<K> &key) = 0;

    /**
     * @brief Moves to the last entry.
     * @return true if the cursor is valid afterwards
     */
    virtual outcome::result<bool> seekLast() = 0;

    [[nodiscard]] virtual bool isValid() const = 0;

    virtual outcome::result<void> next() = 0;

    virtual outcome::result<void> prev() = 0;

    [[nodiscard]] virtual std::optional<K> key() const = 0;

    [[nodiscard]] virtual std::optional<OwnedOrView<V>> value() const = 0;
  };

  /**
   * @brief A mixin for maps that can be traversed in key order.
   */
  template <typename K, typename V>
  struct Iterable {
    using Cursor = MapCursor<K, V>;

    virtual ~Iterable() = default;

    virtual std::unique_ptr<Cursor> cursor() = 0;
  };

}  // namespace tally::storage::face
