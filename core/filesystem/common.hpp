/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

namespace trielog::filesystem {
  using namespace std::filesystem;  // NOLINT(google-build-using-namespace)

  /**
   * Random path built from the model, every '%' is replaced with a random
   * hex digit
   */
  path unique_path(const path &model = "%%%%-%%%%-%%%%-%%%%");
}  // namespace trielog::filesystem
