/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <tuple>
#include <type_traits>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "primitives/common.hpp"

namespace trielog::primitives {
  /**
   * @struct BlockHeader represents header of a block. Only the fields the
   * trie-log maintenance needs are stored.
   */
  struct BlockHeader {
    BlockHash parent_hash{};         ///< 32-byte hash of the parent block
    BlockNumber number{};            ///< index of the block in the chain
    common::Hash256 state_root{};    ///< root of the world state trie

    /// hash of the block, known when the header was read by hash
    mutable std::optional<BlockHash> hash_opt{};

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root)
          == std::tie(rhs.parent_hash, rhs.number, rhs.state_root);
    }

    BlockInfo blockInfo() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be known before taking block info");
      return {number, *hash_opt};
    }
  };

  /**
   * @brief outputs object of type BlockHeader to stream
   * @tparam Stream output stream type
   * @param s stream reference
   * @param bh value to output
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << scale::CompactInteger(bh.number)
             << bh.state_root;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   * @tparam Stream input stream type
   * @param s stream reference
   * @param bh value to decode into
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root;
    bh.number = number_compact.convert_to<BlockNumber>();
    return s;
  }

}  // namespace trielog::primitives
