/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/blockchain_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trielog::blockchain, BlockchainError, e) {
  using E = trielog::blockchain::BlockchainError;
  switch (e) {
    case E::CHAIN_HEAD_NOT_FOUND:
      return "chain head is not found in the database";
    case E::HEADER_NOT_FOUND:
      return "the requested block header is not found in block storage";
  }
  return "unknown error";
}
