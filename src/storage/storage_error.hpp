/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace tally::storage {

  /**
   * @brief Errors of the persistence layer. Any of them means the store is
   * unavailable for the operation that got it; nothing above retries.
   */
  enum class StorageError : int {  // NOLINT(performance-enum-size)

    OK = 0,  ///< success (no error)

    NOT_SUPPORTED = 1,        ///< e.g. merge without a merge rule
    CORRUPTION = 2,           ///< malformed stored value
    INVALID_ARGUMENT = 3,     ///< invalid argument to storage
    IO_ERROR = 4,             ///< IO error in storage
    NOT_FOUND = 5,            ///< entry not found in storage
    DB_PATH_NOT_CREATED = 6,  ///< database directory unusable
    STORAGE_GONE = 7,         ///< database closed before the call

    UNKNOWN = 1000,  ///< unknown error
  };

}  // namespace tally::storage

OUTCOME_HPP_DECLARE_ERROR(tally::storage, StorageError);
