/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace tally::storage::face {

  /**
   * Value type exchanged with a map of T values: either an owned container or
   * a view into memory the map keeps alive. Specialized per value type.
   */
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

}  // namespace tally::storage::face
