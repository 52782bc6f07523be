/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "filesystem/common.hpp"

namespace trielog::log {

  /// Logging configuration: embedded YAML unless a file or text is given
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          filesystem::path path);

    /// Value of `--logcfg` among the given arguments, if any
    static std::optional<filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace trielog::log
