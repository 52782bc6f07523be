/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "application/app_configuration.hpp"
#include "blockchain/blockchain.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"
#include "storage/world_state/world_state_storage.hpp"

namespace trielog::application {

  enum class NodeControllerError {
    // database was created with another data storage format
    STORAGE_FORMAT_MISMATCH = 1,
    // persisted data storage format is not known
    UNKNOWN_STORAGE_FORMAT,
  };

  /**
   * Opens the node database described by the configuration and hands out the
   * components working on it
   */
  class NodeController {
   public:
    /**
     * Opens (or creates) the database under the configured base path.
     * The configured data storage format is persisted on first open and
     * must match the persisted one afterwards.
     */
    static outcome::result<std::unique_ptr<NodeController>> create(
        const AppConfiguration &config);

    /// Same as create(), but over an already opened storage
    static outcome::result<std::unique_ptr<NodeController>> create(
        const AppConfiguration &config,
        std::shared_ptr<storage::SpacedStorage> storage);

    const storage::DataStorageConfiguration &dataStorageConfiguration() const {
      return data_storage_config_;
    }

    std::shared_ptr<storage::WorldStateStorage> worldStateStorage() const {
      return world_state_storage_;
    }

    std::shared_ptr<const blockchain::Blockchain> blockchain() const {
      return blockchain_;
    }

    /// Directory keeping node data beside the database
    const filesystem::path &dataDir() const {
      return data_dir_;
    }

   private:
    NodeController(storage::DataStorageConfiguration data_storage_config,
                   filesystem::path data_dir,
                   std::shared_ptr<storage::SpacedStorage> storage);

    storage::DataStorageConfiguration data_storage_config_;
    filesystem::path data_dir_;
    std::shared_ptr<storage::SpacedStorage> storage_;
    std::shared_ptr<storage::WorldStateStorage> world_state_storage_;
    std::shared_ptr<const blockchain::Blockchain> blockchain_;
  };

}  // namespace trielog::application

OUTCOME_HPP_DECLARE_ERROR(trielog::application, NodeControllerError)
