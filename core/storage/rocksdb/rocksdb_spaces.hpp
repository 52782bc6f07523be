/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "storage/spaces.hpp"

namespace trielog::storage {

  /**
   * Map space item to its column family name
   * @param space - space identifier
   * @return string representation of space name
   */
  std::string spaceName(Space space);

  /// Inverse of spaceName
  std::optional<Space> spaceByName(std::string_view name);

}  // namespace trielog::storage
