/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"

namespace trielog::storage {
  using namespace common::literals;

  inline const common::Buffer kDataStorageFormatKey =
      ":trielog:data_storage_format"_buf;

  inline const common::Buffer kChainHeadLookupKey = ":trielog:chain_head"_buf;

  inline const common::Buffer kLastFinalizedLookupKey =
      ":trielog:last_finalized"_buf;

}  // namespace trielog::storage
