/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/data_storage_configuration.hpp"

namespace trielog::storage {

  std::string_view dataStorageFormatName(DataStorageFormat format) {
    switch (format) {
      case DataStorageFormat::FOREST:
        return "FOREST";
      case DataStorageFormat::BONSAI:
        return "BONSAI";
    }
    return "UNKNOWN";
  }

  std::optional<DataStorageFormat> dataStorageFormatFromName(
      std::string_view name) {
    if (name == "FOREST") {
      return DataStorageFormat::FOREST;
    }
    if (name == "BONSAI") {
      return DataStorageFormat::BONSAI;
    }
    return std::nullopt;
  }

}  // namespace trielog::storage
