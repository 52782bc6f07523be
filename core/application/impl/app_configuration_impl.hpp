/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"

namespace trielog::application {

  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * Parses node options. argv[0] is skipped as the program name.
     * @return false if the node should not start: help was requested or
     * options are invalid
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    /// Options were printed on `--help` by the last initializeFromArgs
    bool helpRequested() const {
      return help_requested_;
    }

    filesystem::path basePath() const override {
      return base_path_;
    }

    filesystem::path databasePath() const override;

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    const storage::DataStorageConfiguration &dataStorageConfiguration()
        const override {
      return data_storage_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_storage_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"storage", std::bind(&AppConfigurationImpl::parse_storage_segment, this, std::placeholders::_1)},
    };
    // clang-format on

    bool validate_config();

    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target);

    bool set_data_storage_format(const std::string &name);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;

    std::vector<std::string> logger_tuning_config_;
    filesystem::path base_path_;
    storage::DataStorageConfiguration data_storage_config_;
    bool config_file_valid_ = true;
    bool help_requested_ = false;
  };

}  // namespace trielog::application
