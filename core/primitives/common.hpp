/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>
#include <boost/container_hash/hash.hpp>
#include <boost/operators.hpp>

#include "common/blob.hpp"

namespace trielog::primitives {
  using BlockNumber = uint64_t;
  using BlockHash = common::Hash256;

  /// Block hash together with its number
  struct BlockInfo : public boost::equality_comparable<BlockInfo>,
                     public boost::less_than_comparable<BlockInfo> {
    BlockInfo() = default;

    BlockInfo(const BlockNumber &n, const BlockHash &h) : number(n), hash(h) {}

    BlockNumber number{};
    BlockHash hash{};

    bool operator==(const BlockInfo &o) const {
      return number == o.number and hash == o.hash;
    }

    bool operator<(const BlockInfo &o) const {
      return number < o.number or (number == o.number and hash < o.hash);
    }
  };

}  // namespace trielog::primitives

template <>
struct std::hash<trielog::primitives::BlockInfo> {
  size_t operator()(const trielog::primitives::BlockInfo &x) const {
    size_t hash = 0;
    boost::hash_combine(hash, x.number);
    boost::hash_combine(hash, std::hash<trielog::common::Hash256>{}(x.hash));
    return hash;
  }
};

template <>
struct fmt::formatter<trielog::primitives::BlockInfo> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const trielog::primitives::BlockInfo &block_info,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(
          ctx.out(), "#{} ({:s})", block_info.number, block_info.hash);
    }
    return fmt::format_to(
        ctx.out(), "#{} ({:l})", block_info.number, block_info.hash);
  }
};
