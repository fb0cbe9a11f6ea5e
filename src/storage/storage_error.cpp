/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tally::storage, StorageError, e) {
  using E = StorageError;
  switch (e) {
    case E::OK:
      return "success";
    case E::NOT_SUPPORTED:
      return "operation is not supported by this storage space";
    case E::CORRUPTION:
      return "stored data is corrupted";
    case E::INVALID_ARGUMENT:
      return "invalid argument passed to storage";
    case E::IO_ERROR:
      return "storage IO failure";
    case E::NOT_FOUND:
      return "no value stored under the key";
    case E::DB_PATH_NOT_CREATED:
      return "database directory could not be created";
    case E::STORAGE_GONE:
      return "database is already closed";
    case E::UNKNOWN:
      break;
  }
  return "unknown storage error";
}
