/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"
#include "primitives/common.hpp"

namespace trielog::blockchain {

  /**
   * Read-only view of the locally stored chain: its head, the last finalized
   * block, the canonical number-to-hash index and block headers
   */
  class Blockchain {
   public:
    virtual ~Blockchain() = default;

    /**
     * @return best block of the canonical chain, or
     * BlockchainError::CHAIN_HEAD_NOT_FOUND if the chain is empty
     */
    virtual outcome::result<primitives::BlockInfo> chainHead() const = 0;

    /**
     * @return last finalized block if finality has been recorded
     */
    virtual outcome::result<std::optional<primitives::BlockInfo>>
    lastFinalized() const = 0;

    /**
     * @return hash of the canonical block with the given number, if any
     */
    virtual outcome::result<std::optional<primitives::BlockHash>>
    blockHashByNumber(primitives::BlockNumber number) const = 0;

    /**
     * @return header of the block with the given hash, if it is stored
     */
    virtual outcome::result<std::optional<primitives::BlockHeader>>
    blockHeader(const primitives::BlockHash &block_hash) const = 0;
  };

}  // namespace trielog::blockchain
