/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <gmock/gmock.h>

namespace trielog::application {

  class AppConfigurationMock : public AppConfiguration {
   public:
    MOCK_METHOD(filesystem::path, basePath, (), (const, override));

    MOCK_METHOD(filesystem::path, databasePath, (), (const, override));

    MOCK_METHOD(const std::vector<std::string> &, log, (), (const, override));

    MOCK_METHOD(const storage::DataStorageConfiguration &,
                dataStorageConfiguration,
                (),
                (const, override));
  };

}  // namespace trielog::application
