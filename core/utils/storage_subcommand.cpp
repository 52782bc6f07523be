/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/storage_subcommand.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <map>
#include <span>

#include <fmt/format.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/node_controller.hpp"
#include "log/formatters/filepath.hpp"
#include "storage/trie_log/trie_log_maintainer.hpp"
#include "utils/profiler.hpp"

using trielog::application::AppConfiguration;
using trielog::application::AppConfigurationImpl;
using trielog::application::NodeController;
using trielog::primitives::BlockHash;
using trielog::storage::DataStorageFormat;
using trielog::storage::trie_log::TrieLogMaintainer;

using ArgumentList = std::span<const char *>;

namespace {

  class CommandExecutionError : public std::runtime_error {
   public:
    CommandExecutionError(std::string_view command_name,
                          const std::string &what)
        : std::runtime_error{what}, command_name{command_name} {}

    friend std::ostream &operator<<(std::ostream &out,
                                    const CommandExecutionError &err) {
      return out << "Error in command '" << err.command_name
                 << "': " << err.what() << "\n";
    }

   private:
    std::string command_name;
  };

  class Command {
   public:
    Command(std::string name, std::string description)
        : name{std::move(name)}, description{std::move(description)} {}

    virtual ~Command() = default;

    /// args[0] is the name of the command
    virtual void execute(std::ostream &out, const ArgumentList &args) = 0;

    std::string_view getName() const {
      return name;
    }

    std::string_view getDescription() const {
      return description;
    }

   protected:
    void assertArgumentCount(const ArgumentList &args,
                             size_t min,
                             size_t max) const {
      if (args.size() < min or args.size() > max) {
        throw CommandExecutionError{
            name,
            fmt::format("Argument count mismatch: expected {} to {}, got {}",
                        min,
                        max,
                        args.size())};
      }
    }

    template <typename... Ts>
    [[noreturn]] void throwError(const char *fmt, const Ts &...ts) const {
      throw CommandExecutionError(
          name, ::fmt::vformat(fmt, fmt::make_format_args(ts...)));
    }

    template <typename T>
    T unwrapResult(std::string_view context, outcome::result<T> &&res) const {
      if (res.has_value()) {
        return std::move(res).value();
      }
      throwError("{}: {}", context, res.error().message());
    }

   private:
    std::string name;
    std::string description;
  };

  class CommandParser {
   public:
    void addCommand(std::unique_ptr<Command> cmd) {
      std::string name{cmd->getName()};
      commands_.insert({name, std::move(cmd)});
    }

    /**
     * Runs the command named by args[1]
     * @return false if there is no such command
     */
    bool dispatch(std::ostream &out, const ArgumentList &args) const {
      if (args.size() < 2) {
        std::cerr << "Unspecified command!\nAvailable commands are:\n";
        printCommands(std::cerr);
        return false;
      }
      auto command = commands_.find(args[1]);
      if (command == commands_.cend()) {
        std::cerr << "Unknown command '" << args[1]
                  << "'!\nAvailable commands are:\n";
        printCommands(std::cerr);
        return false;
      }
      command->second->execute(out, args.subspan(1));
      return true;
    }

    /// @return process exit code
    int invoke(const ArgumentList &args) const {
      try {
        return dispatch(std::cout, args) ? EXIT_SUCCESS : EXIT_FAILURE;
      } catch (const CommandExecutionError &e) {
        std::cerr << e;
      } catch (const std::exception &e) {
        std::cerr << "Exception occurred: " << e.what() << "\n";
      }
      return EXIT_FAILURE;
    }

    void printCommands(std::ostream &out) const {
      for (auto &[name, cmd] : commands_) {
        out << name << "\t" << cmd->getDescription() << "\n";
      }
    }

   private:
    std::map<std::string, std::unique_ptr<Command>, std::less<>> commands_;
  };

  class PrintHelpCommand final : public Command {
   public:
    explicit PrintHelpCommand(const CommandParser &parser)
        : Command{"help", "print help message"}, parser{parser} {}

    void execute(std::ostream &out, const ArgumentList &args) override {
      assertArgumentCount(args, 1, 1);
      parser.printCommands(out);
    }

   private:
    const CommandParser &parser;
  };

  /**
   * Opens the node storage on first use, so that `help` works without a
   * database
   */
  class TrieLogContext {
   public:
    explicit TrieLogContext(std::shared_ptr<const AppConfiguration> config)
        : config_{std::move(config)} {}

    const AppConfiguration &configuration() const {
      return *config_;
    }

    outcome::result<std::shared_ptr<TrieLogMaintainer>> maintainer() {
      if (maintainer_) {
        return maintainer_;
      }
      trielog::log::setLevelOfGroup("trie_log", trielog::log::Level::DEBUG);
      OUTCOME_TRY(controller, NodeController::create(*config_));
      controller_ = std::move(controller);
      maintainer_ = std::make_shared<TrieLogMaintainer>(
          controller_->dataStorageConfiguration(),
          controller_->worldStateStorage(),
          controller_->blockchain());
      return maintainer_;
    }

   private:
    std::shared_ptr<const AppConfiguration> config_;
    std::unique_ptr<NodeController> controller_;
    std::shared_ptr<TrieLogMaintainer> maintainer_;
  };

  class TrieLogCommand : public Command {
   public:
    TrieLogCommand(std::string name,
                   std::string description,
                   std::shared_ptr<TrieLogContext> context)
        : Command{std::move(name), std::move(description)},
          context_{std::move(context)},
          logger_{trielog::log::createLogger("TrieLogCommand", "trie_log")} {}

   protected:
    /// Refuses a FOREST configuration before the database is opened
    TrieLogMaintainer &maintainer() {
      if (context_->configuration().dataStorageConfiguration().format
          != DataStorageFormat::BONSAI) {
        throwError("Subcommand only works with data-storage-format=BONSAI");
      }
      return *unwrapResult("Failed to open node storage",
                           context_->maintainer());
    }

    trielog::filesystem::path defaultFilePath() const {
      return context_->configuration().basePath() / "trie-logs.bin";
    }

    boost::program_options::variables_map parseOptions(
        const boost::program_options::options_description &desc,
        const ArgumentList &args) const {
      namespace po = boost::program_options;
      po::variables_map vm;
      try {
        po::store(po::command_line_parser(static_cast<int>(args.size()),
                                          args.data())
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
      } catch (const po::error &e) {
        throwError("{}", e.what());
      }
      return vm;
    }

    std::shared_ptr<TrieLogContext> context_;
    trielog::log::Logger logger_;
  };

  class CountTrieLogsCommand final : public TrieLogCommand {
   public:
    explicit CountTrieLogsCommand(std::shared_ptr<TrieLogContext> context)
        : TrieLogCommand{"count",
                         "count trie logs by canonical, fork and orphaned "
                         "blocks",
                         std::move(context)} {}

    void execute(std::ostream &out, const ArgumentList &args) override {
      assertArgumentCount(args, 1, 1);
      auto &trie_logs = maintainer();
      out << "Counting trie logs..." << std::endl;
      trielog::TicToc timer{"Trie log count", logger_};
      auto count = unwrapResult(
          "Failed to count trie logs",
          trie_logs.count(std::numeric_limits<int32_t>::max()));
      out << fmt::format(
          "trieLog count: {}\n"
          " - canonical count: {}\n"
          " - fork count: {}\n"
          " - orphaned count: {}\n",
          count.total,
          count.canonical,
          count.fork,
          count.orphaned);
    }
  };

  class PruneTrieLogsCommand final : public TrieLogCommand {
   public:
    explicit PruneTrieLogsCommand(std::shared_ptr<TrieLogContext> context)
        : TrieLogCommand{"prune",
                         "remove trie logs of blocks outside the retention "
                         "window and of non-canonical blocks",
                         std::move(context)} {}

    void execute(std::ostream &out, const ArgumentList &args) override {
      assertArgumentCount(args, 1, 1);
      auto &trie_logs = maintainer();
      trielog::TicToc timer{"Trie log prune", logger_};
      auto stats =
          unwrapResult("Failed to prune trie logs",
                       trie_logs.prune(context_->configuration().basePath()));
      out << fmt::format("Pruned {} trie logs, retained {}\n",
                         stats.pruned,
                         stats.retained);
    }
  };

  class ExportTrieLogsCommand final : public TrieLogCommand {
   public:
    explicit ExportTrieLogsCommand(std::shared_ptr<TrieLogContext> context)
        : TrieLogCommand{"export",
                         "--trie-log-block-hash <hash,...> "
                         "[--trie-log-file-path <path>] - write trie logs of "
                         "the given blocks to a file",
                         std::move(context)} {}

    void execute(std::ostream &out, const ArgumentList &args) override {
      namespace po = boost::program_options;
      // clang-format off
      po::options_description desc("Export options");
      desc.add_options()
          ("trie-log-block-hash", po::value<std::vector<std::string>>()->multitoken()->required(),
            "comma separated 0x-prefixed hashes of the blocks to export")
          ("trie-log-file-path", po::value<std::string>(),
            "file to write, <base-path>/trie-logs.bin by default")
          ;
      // clang-format on
      auto vm = parseOptions(desc, args);

      auto block_hashes =
          parseBlockHashes(vm["trie-log-block-hash"].as<std::vector<std::string>>());
      trielog::filesystem::path path = vm.count("trie-log-file-path") > 0
          ? trielog::filesystem::path{vm["trie-log-file-path"].as<std::string>()}
          : defaultFilePath();

      auto &trie_logs = maintainer();
      auto exported = unwrapResult("Failed to export trie logs",
                                   trie_logs.exportTrieLog(block_hashes, path));
      out << fmt::format("Exported {} trie logs to {}\n", exported, path);
    }

   private:
    std::vector<BlockHash> parseBlockHashes(
        const std::vector<std::string> &values) const {
      std::vector<BlockHash> block_hashes;
      for (const auto &value : values) {
        std::vector<std::string> parts;
        boost::algorithm::split(parts, value, boost::algorithm::is_any_of(","));
        for (auto &part : parts) {
          boost::algorithm::trim(part);
          if (part.empty()) {
            continue;
          }
          auto block_hash = BlockHash::fromHexWithPrefix(part);
          if (block_hash.has_error()) {
            throwError("Invalid block hash '{}': {}",
                       part,
                       block_hash.error().message());
          }
          block_hashes.emplace_back(block_hash.value());
        }
      }
      if (block_hashes.empty()) {
        throwError("At least one block hash is required");
      }
      return block_hashes;
    }
  };

  class ImportTrieLogsCommand final : public TrieLogCommand {
   public:
    explicit ImportTrieLogsCommand(std::shared_ptr<TrieLogContext> context)
        : TrieLogCommand{"import",
                         "[--trie-log-file-path <path>] - put trie logs from "
                         "a file into the storage",
                         std::move(context)} {}

    void execute(std::ostream &out, const ArgumentList &args) override {
      namespace po = boost::program_options;
      po::options_description desc("Import options");
      desc.add_options()("trie-log-file-path",
                         po::value<std::string>(),
                         "file to read, <base-path>/trie-logs.bin by default");
      auto vm = parseOptions(desc, args);

      trielog::filesystem::path path = vm.count("trie-log-file-path") > 0
          ? trielog::filesystem::path{vm["trie-log-file-path"].as<std::string>()}
          : defaultFilePath();

      auto &trie_logs = maintainer();
      auto imported = unwrapResult("Failed to import trie logs",
                                   trie_logs.importTrieLog(path));
      out << fmt::format("Imported {} trie logs from {}\n", imported, path);
    }
  };

  class TrieLogsCommand final : public Command {
   public:
    explicit TrieLogsCommand(std::shared_ptr<TrieLogContext> context)
        : Command{"trie-logs",
                  "<count|prune|export|import|help> - maintain trie logs of "
                  "the BONSAI world state"} {
      parser_.addCommand(std::make_unique<PrintHelpCommand>(parser_));
      parser_.addCommand(std::make_unique<CountTrieLogsCommand>(context));
      parser_.addCommand(std::make_unique<PruneTrieLogsCommand>(context));
      parser_.addCommand(std::make_unique<ExportTrieLogsCommand>(context));
      parser_.addCommand(
          std::make_unique<ImportTrieLogsCommand>(std::move(context)));
    }

    void execute(std::ostream &out, const ArgumentList &args) override {
      if (not parser_.dispatch(out, args)) {
        throwError("Usage: storage trie-logs <command> [options] "
                   "[-- node options]");
      }
    }

   private:
    CommandParser parser_;
  };

}  // namespace

namespace trielog {

  int storage_subcommand_main(int argc, const char **argv) {
    ArgumentList args(argv, argc);

    // node options follow "--" which takes the place of the program name
    size_t node_args_start = args.size();
    for (size_t i = 1; i < args.size(); i++) {
      if (std::strcmp(args[i], "--") == 0) {
        node_args_start = i;
        break;
      }
    }
    std::vector<const char *> node_args{"trielog"};
    if (node_args_start < args.size()) {
      auto rest = args.subspan(node_args_start + 1);
      node_args.insert(node_args.end(), rest.begin(), rest.end());
    }

    auto configuration = std::make_shared<AppConfigurationImpl>(
        log::createLogger("AppConfiguration", "application"));
    if (not configuration->initializeFromArgs(
            static_cast<int>(node_args.size()), node_args.data())) {
      if (configuration->helpRequested()) {
        return EXIT_SUCCESS;
      }
      std::cerr << "Failed to initialize node configuration\n";
      return EXIT_FAILURE;
    }
    if (auto res = log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      std::cerr << "Invalid logging options: " << res.error().message()
                << "\n";
      return EXIT_FAILURE;
    }

    auto context = std::make_shared<TrieLogContext>(configuration);

    CommandParser parser;
    parser.addCommand(std::make_unique<PrintHelpCommand>(parser));
    parser.addCommand(std::make_unique<TrieLogsCommand>(std::move(context)));

    return parser.invoke(args.first(node_args_start));
  }

}  // namespace trielog
