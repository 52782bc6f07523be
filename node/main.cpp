/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "utils/storage_subcommand.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Available subcommands: storage\n"
                 "Usage: trielog storage trie-logs "
                 "<count|prune|export|import|help> [command options] "
                 "[-- node options]\n";
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("trielog");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        trielog::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto trielog_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<trielog::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<trielog::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(trielog_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  trielog::log::setLoggingSystem(logging_system);

  int exit_code = EXIT_FAILURE;

  if (argc <= 1) {
    wrong_usage();
  } else {
    std::string_view name{argv[1]};

    if (name == "storage") {
      exit_code = trielog::storage_subcommand_main(argc - 1, argv + 1);
    } else {
      wrong_usage();
    }
  }

  auto logger =
      trielog::log::createLogger("Main", trielog::log::defaultGroupName);
  SL_DEBUG(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
