/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trielog::storage, DatabaseError, e) {
  using E = trielog::storage::DatabaseError;
  switch (e) {
    case E::NOT_FOUND:
      return "entry not found in database";
    case E::CORRUPTION:
      return "data corruption in database";
    case E::NOT_SUPPORTED:
      return "operation is not supported in database";
    case E::INVALID_ARGUMENT:
      return "invalid argument to database";
    case E::IO_ERROR:
      return "IO error in database";
    case E::STORAGE_GONE:
      return "database instance has been closed";
    case E::UNEXPECTED_SPACE:
      return "database contains a column family of unknown space";
    case E::UNKNOWN:
      break;
  }
  return "unknown database error";
}
