/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>
#include <string>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

#include "log/formatters/filepath.hpp"

namespace {
  namespace fs = trielog::filesystem;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  const auto def_data_storage_format = "BONSAI";
  const uint64_t def_trie_log_retention =
      trielog::storage::DataStorageConfiguration::kDefaultTrieLogRetention;
  const uint32_t def_trie_log_prune_batch_size =
      trielog::storage::DataStorageConfiguration::kDefaultTrieLogPruneBatchSize;
}  // namespace

namespace trielog::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {
    std::error_code ec;
    base_path_ = fs::current_path(ec);
    if (ec) {
      base_path_ = ".";
    }
  }

  filesystem::path AppConfigurationImpl::databasePath() const {
    return base_path_ / "database";
  }

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    BOOST_ASSERT(!filepath.empty());
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    for (auto &v : m->value.GetArray()) {
      if (v.IsString()) {
        target.emplace_back(v.GetString(), v.GetStringLength());
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u64(const rapidjson::Value &val,
                                      const char *name,
                                      uint64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint64()) {
      target = m->value.GetUint64();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::set_data_storage_format(const std::string &name) {
    auto format = storage::dataStorageFormatFromName(name);
    if (not format) {
      SL_ERROR(logger_,
               "Unsupported data storage format was specified {}, "
               "available options are [FOREST, BONSAI]",
               name);
      return false;
    }
    data_storage_config_.format = *format;
    return true;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_storage_segment(
      const rapidjson::Value &val) {
    std::string base_path_str;
    if (load_str(val, "base-path", base_path_str)) {
      base_path_ = fs::path(base_path_str);
    }

    std::string format_str;
    if (load_str(val, "data-storage-format", format_str)
        and not set_data_storage_format(format_str)) {
      config_file_valid_ = false;
    }
    load_u64(val,
             "bonsai-historical-block-limit",
             data_storage_config_.trie_log_retention);
    load_u32(val,
             "trie-log-prune-batch-size",
             data_storage_config_.trie_log_prune_batch_size);
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not a JSON object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return config_file_valid_;
  }

  bool AppConfigurationImpl::validate_config() {
    if (base_path_.empty()) {
      SL_ERROR(logger_,
               "Base path is empty, "
               "please specify a valid path with -d option");
      return false;
    }

    if (data_storage_config_.trie_log_prune_batch_size == 0) {
      SL_ERROR(logger_,
               "Trie log prune batch size must be positive, "
               "please specify a valid value with --trie-log-prune-batch-size "
               "option");
      return false;
    }

    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -ltrie_log=trace.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to the logging system configuration (YAML)")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description storage_desc("Storage options");
    storage_desc.add_options()
        ("base-path,d", po::value<std::string>(), "node base path (keeps the database), current directory by default")
        ("data-storage-format", po::value<std::string>()->default_value(def_data_storage_format),
          "world state format [FOREST, BONSAI]")
        ("bonsai-historical-block-limit", po::value<uint64_t>()->default_value(def_trie_log_retention),
          "number of most recent canonical blocks whose trie logs are kept")
        ("trie-log-prune-batch-size", po::value<uint32_t>()->default_value(def_trie_log_prune_batch_size),
          "number of trie logs removed per committed batch while pruning")
        ;
    // clang-format on

    desc.add(storage_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    help_requested_ = vm.count("help") > 0;
    if (help_requested_) {
      std::cout << desc << std::endl;
      return false;
    }

    bool config_file_ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      config_file_ok = read_config_from_file(path);
    });
    if (not config_file_ok) {
      return false;
    }

    find_argument<std::string>(
        vm, "base-path", [&](const std::string &val) { base_path_ = val; });

    bool format_ok = true;
    find_argument<std::string>(
        vm, "data-storage-format", [&](const std::string &val) {
          format_ok = set_data_storage_format(val);
        });
    if (not format_ok) {
      return false;
    }

    find_argument<uint64_t>(
        vm, "bonsai-historical-block-limit", [&](uint64_t val) {
          data_storage_config_.trie_log_retention = val;
        });

    find_argument<uint32_t>(vm, "trie-log-prune-batch-size", [&](uint32_t val) {
      data_storage_config_.trie_log_prune_batch_size = val;
    });

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }
}  // namespace trielog::application
