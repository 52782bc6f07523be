/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/storage_util.hpp"

#include "storage/database_error.hpp"
#include "storage/predefined_keys.hpp"

using trielog::common::Buffer;
using trielog::primitives::BlockHash;
using trielog::storage::Space;

namespace trielog::blockchain {

  outcome::result<std::optional<primitives::BlockHash>> blockHashByNumber(
      storage::SpacedStorage &storage, primitives::BlockNumber block_number) {
    return hashByLookupKey(storage, blockNumberToKey(block_number));
  }

  outcome::result<std::optional<primitives::BlockHash>> hashByLookupKey(
      storage::SpacedStorage &storage, const common::BufferView &key) {
    auto key_space = storage.getSpace(Space::kLookupKey);
    OUTCOME_TRY(data_opt, key_space->tryGet(key));
    if (data_opt.has_value()) {
      OUTCOME_TRY(hash, BlockHash::fromSpan(data_opt->view()));
      return hash;
    }
    return std::nullopt;
  }

  outcome::result<std::optional<primitives::BlockHeader>> getBlockHeader(
      storage::SpacedStorage &storage, const primitives::BlockHash &block_hash) {
    auto header_space = storage.getSpace(Space::kHeader);
    OUTCOME_TRY(encoded_opt, header_space->tryGet(block_hash));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(header,
                scale::decode<primitives::BlockHeader>(encoded_opt->view()));
    header.hash_opt = block_hash;
    return header;
  }

  outcome::result<void> putBlockHeader(storage::SpacedStorage &storage,
                                       const primitives::BlockHash &block_hash,
                                       const primitives::BlockHeader &header) {
    OUTCOME_TRY(encoded, scale::encode(header));
    auto header_space = storage.getSpace(Space::kHeader);
    return header_space->put(block_hash, Buffer{std::move(encoded)});
  }

  outcome::result<void> putNumberToHash(storage::SpacedStorage &storage,
                                        const primitives::BlockInfo &block) {
    auto key_space = storage.getSpace(Space::kLookupKey);
    return key_space->put(blockNumberToKey(block.number), Buffer(block.hash));
  }

  outcome::result<void> setChainHead(storage::SpacedStorage &storage,
                                     const primitives::BlockHash &block_hash) {
    auto key_space = storage.getSpace(Space::kLookupKey);
    return key_space->put(storage::kChainHeadLookupKey, Buffer(block_hash));
  }

  outcome::result<void> setLastFinalized(
      storage::SpacedStorage &storage, const primitives::BlockHash &block_hash) {
    auto key_space = storage.getSpace(Space::kLookupKey);
    return key_space->put(storage::kLastFinalizedLookupKey, Buffer(block_hash));
  }

}  // namespace trielog::blockchain
