/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "filesystem/common.hpp"
#include "outcome/outcome.hpp"

namespace trielog {
  /**
   * Creates the directory with all missing parents.
   * `create_directories` returns `false` for an existing directory, so the
   * error code is the only failure indicator.
   */
  inline outcome::result<void> mkdirs(const filesystem::path &path) {
    std::error_code ec;
    filesystem::create_directories(path, ec);
    if (ec) {
      return ec;
    }
    return outcome::success();
  }
}  // namespace trielog
