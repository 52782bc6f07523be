/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "primitives/block_header.hpp"
#include "storage/spaced_storage.hpp"

/**
 * Storage schema overview
 *
 * Headers are stored in Space::kHeader under the block hash.
 *
 * Space::kLookupKey holds the canonical chain index: the 8-byte big-endian
 * block number maps to the hash of the canonical block with that number.
 * The same space keeps the chain head and last finalized hashes under the
 * predefined lookup keys.
 */

/**
 * Auxiliary functions to simplify usage of persistant map based storage
 * as a Blockchain storage
 */

namespace trielog::blockchain {

  /**
   * Convert block number into short lookup key (BE representation) for
   * blocks that are in the canonical chain. Big-endian keeps the index
   * ordered by number.
   */
  inline common::Buffer blockNumberToKey(primitives::BlockNumber block_number) {
    BOOST_STATIC_ASSERT(std::is_same_v<decltype(block_number), uint64_t>);
    common::Buffer res;
    res.putUint64(block_number);
    return res;
  }

  /**
   * Returns block hash by number if any
   */
  outcome::result<std::optional<primitives::BlockHash>> blockHashByNumber(
      storage::SpacedStorage &storage, primitives::BlockNumber block_number);

  /**
   * Reads a hash stored under a lookup key
   */
  outcome::result<std::optional<primitives::BlockHash>> hashByLookupKey(
      storage::SpacedStorage &storage, const common::BufferView &key);

  /**
   * Reads and decodes a header. The hash of the returned header is set.
   */
  outcome::result<std::optional<primitives::BlockHeader>> getBlockHeader(
      storage::SpacedStorage &storage, const primitives::BlockHash &block_hash);

  /**
   * Encodes a header and stores it under the given hash
   */
  outcome::result<void> putBlockHeader(storage::SpacedStorage &storage,
                                       const primitives::BlockHash &block_hash,
                                       const primitives::BlockHeader &header);

  /**
   * Marks the block as canonical for its number
   */
  outcome::result<void> putNumberToHash(storage::SpacedStorage &storage,
                                        const primitives::BlockInfo &block);

  outcome::result<void> setChainHead(storage::SpacedStorage &storage,
                                     const primitives::BlockHash &block_hash);

  outcome::result<void> setLastFinalized(
      storage::SpacedStorage &storage, const primitives::BlockHash &block_hash);

}  // namespace trielog::blockchain
