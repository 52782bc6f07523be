/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/blockchain.hpp"

#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace trielog::blockchain {

  /// Chain view over the header and lookup spaces of the node database
  class KeyValueBlockchain : public Blockchain {
   public:
    explicit KeyValueBlockchain(std::shared_ptr<storage::SpacedStorage> storage);

    ~KeyValueBlockchain() override = default;

    outcome::result<primitives::BlockInfo> chainHead() const override;

    outcome::result<std::optional<primitives::BlockInfo>> lastFinalized()
        const override;

    outcome::result<std::optional<primitives::BlockHash>> blockHashByNumber(
        primitives::BlockNumber number) const override;

    outcome::result<std::optional<primitives::BlockHeader>> blockHeader(
        const primitives::BlockHash &block_hash) const override;

   private:
    outcome::result<std::optional<primitives::BlockInfo>> blockInfoByLookupKey(
        const common::BufferView &key) const;

    std::shared_ptr<storage::SpacedStorage> storage_;
    log::Logger logger_;
  };

}  // namespace trielog::blockchain
