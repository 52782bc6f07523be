/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trielog::blockchain {
  /**
   * @brief Errors of the chain view
   */
  enum class BlockchainError {
    // chain head is not set in the database
    CHAIN_HEAD_NOT_FOUND = 1,
    // block header is not found in block storage
    HEADER_NOT_FOUND,
  };
}  // namespace trielog::blockchain

OUTCOME_HPP_DECLARE_ERROR(trielog::blockchain, BlockchainError)
