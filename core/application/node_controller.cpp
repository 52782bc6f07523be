/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/node_controller.hpp"

#include "blockchain/impl/key_value_blockchain.hpp"
#include "storage/predefined_keys.hpp"
#include "storage/rocksdb/rocksdb.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trielog::application, NodeControllerError, e) {
  using E = trielog::application::NodeControllerError;
  switch (e) {
    case E::STORAGE_FORMAT_MISMATCH:
      return "database was created with another data storage format";
    case E::UNKNOWN_STORAGE_FORMAT:
      return "database keeps an unknown data storage format";
  }
  return "unknown NodeControllerError";
}

namespace trielog::application {

  namespace {
    outcome::result<void> checkDataStorageFormat(
        storage::SpacedStorage &storage,
        storage::DataStorageFormat configured,
        const log::Logger &logger) {
      auto space = storage.getSpace(storage::Space::kDefault);
      OUTCOME_TRY(persisted_opt, space->tryGet(storage::kDataStorageFormatKey));
      if (not persisted_opt) {
        SL_INFO(logger,
                "Database has no data storage format yet, using {}",
                storage::dataStorageFormatName(configured));
        return space->put(storage::kDataStorageFormatKey,
                          common::Buffer::fromString(
                              storage::dataStorageFormatName(configured)));
      }

      auto persisted_name = persisted_opt->view().toStringView();
      auto persisted = storage::dataStorageFormatFromName(persisted_name);
      if (not persisted) {
        SL_ERROR(logger,
                 "Database keeps unknown data storage format '{}'",
                 persisted_name);
        return NodeControllerError::UNKNOWN_STORAGE_FORMAT;
      }
      if (*persisted != configured) {
        SL_ERROR(logger,
                 "Database was created with data storage format {}, "
                 "but {} is configured",
                 persisted_name,
                 storage::dataStorageFormatName(configured));
        return NodeControllerError::STORAGE_FORMAT_MISMATCH;
      }
      return outcome::success();
    }
  }  // namespace

  NodeController::NodeController(
      storage::DataStorageConfiguration data_storage_config,
      filesystem::path data_dir,
      std::shared_ptr<storage::SpacedStorage> storage)
      : data_storage_config_{data_storage_config},
        data_dir_{std::move(data_dir)},
        storage_{std::move(storage)},
        world_state_storage_{std::make_shared<storage::WorldStateStorage>(
            storage_, data_storage_config_.format)},
        blockchain_{std::make_shared<blockchain::KeyValueBlockchain>(storage_)} {
  }

  outcome::result<std::unique_ptr<NodeController>> NodeController::create(
      const AppConfiguration &config) {
    auto logger = log::createLogger("NodeController", "application");
    SL_DEBUG(logger, "Opening database in {}", config.databasePath());
    OUTCOME_TRY(database, storage::RocksDb::create(config.databasePath()));
    return create(config, std::move(database));
  }

  outcome::result<std::unique_ptr<NodeController>> NodeController::create(
      const AppConfiguration &config,
      std::shared_ptr<storage::SpacedStorage> storage) {
    auto logger = log::createLogger("NodeController", "application");
    const auto &data_storage_config = config.dataStorageConfiguration();
    OUTCOME_TRY(
        checkDataStorageFormat(*storage, data_storage_config.format, logger));
    return std::unique_ptr<NodeController>(new NodeController(
        data_storage_config, config.basePath(), std::move(storage)));
  }

}  // namespace trielog::application
