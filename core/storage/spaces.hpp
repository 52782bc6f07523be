/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace trielog::storage {

  enum Space : uint8_t {
    // must have spaces
    kDefault = 0,
    kLookupKey,

    // application-defined spaces
    kHeader,
    kTrieLog,

    kTotal
  };
}  // namespace trielog::storage
