/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trielog::storage {

  /**
   * @brief universal database interface error
   */
  enum class DatabaseError : int {
    NOT_FOUND = 1,
    CORRUPTION,
    NOT_SUPPORTED,
    INVALID_ARGUMENT,
    IO_ERROR,
    STORAGE_GONE,
    UNEXPECTED_SPACE,

    UNKNOWN = 1000
  };
}  // namespace trielog::storage

OUTCOME_HPP_DECLARE_ERROR(trielog::storage, DatabaseError);
