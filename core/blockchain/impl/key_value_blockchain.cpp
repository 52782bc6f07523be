/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/key_value_blockchain.hpp"

#include "blockchain/blockchain_error.hpp"
#include "blockchain/impl/storage_util.hpp"
#include "storage/predefined_keys.hpp"

namespace trielog::blockchain {

  KeyValueBlockchain::KeyValueBlockchain(
      std::shared_ptr<storage::SpacedStorage> storage)
      : storage_{std::move(storage)},
        logger_{log::createLogger("Blockchain", "blockchain")} {
    BOOST_ASSERT(storage_ != nullptr);
  }

  outcome::result<primitives::BlockInfo> KeyValueBlockchain::chainHead() const {
    OUTCOME_TRY(head, blockInfoByLookupKey(storage::kChainHeadLookupKey));
    if (not head) {
      return BlockchainError::CHAIN_HEAD_NOT_FOUND;
    }
    return *head;
  }

  outcome::result<std::optional<primitives::BlockInfo>>
  KeyValueBlockchain::lastFinalized() const {
    return blockInfoByLookupKey(storage::kLastFinalizedLookupKey);
  }

  outcome::result<std::optional<primitives::BlockHash>>
  KeyValueBlockchain::blockHashByNumber(primitives::BlockNumber number) const {
    return blockchain::blockHashByNumber(*storage_, number);
  }

  outcome::result<std::optional<primitives::BlockHeader>>
  KeyValueBlockchain::blockHeader(const primitives::BlockHash &block_hash) const {
    return getBlockHeader(*storage_, block_hash);
  }

  outcome::result<std::optional<primitives::BlockInfo>>
  KeyValueBlockchain::blockInfoByLookupKey(
      const common::BufferView &key) const {
    OUTCOME_TRY(hash_opt, hashByLookupKey(*storage_, key));
    if (not hash_opt) {
      return std::nullopt;
    }
    OUTCOME_TRY(header_opt, getBlockHeader(*storage_, *hash_opt));
    if (not header_opt) {
      SL_ERROR(logger_,
               "Header of block {} referenced by lookup key {} is missing",
               *hash_opt,
               key.toStringView());
      return BlockchainError::HEADER_NOT_FOUND;
    }
    return primitives::BlockInfo{header_opt->number, *hash_opt};
  }

}  // namespace trielog::blockchain
