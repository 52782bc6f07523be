/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "filesystem/common.hpp"
#include "storage/data_storage_configuration.hpp"

namespace trielog::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return path to the node's directory (contains the database and the
     * default trie-log file)
     */
    virtual filesystem::path basePath() const = 0;

    /**
     * @return path to the node's database
     */
    virtual filesystem::path databasePath() const = 0;

    /**
     * @return logging system tuning config
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return world state format and trie-log maintenance settings
     */
    virtual const storage::DataStorageConfiguration &dataStorageConfiguration()
        const = 0;
  };

}  // namespace trielog::application
