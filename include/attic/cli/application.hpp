#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "attic/app/service_factory.hpp"
#include "attic/common.hpp"
#include "attic/util/environment.hpp"

namespace attic::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;        // --json: Output in JSON format
  int verbose = 0;          // --verbose: Debug output on stderr
  bool quiet = false;       // --quiet: Suppress normal output
  std::string config_file;  // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
 public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  // Setup command-specific CLI options
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }

  // Commands that only read the environment skip route table and manifest setup
  virtual bool needsServices() const { return true; }
};

/**
 * @brief Main CLI application
 */
class Application {
 public:
  Application();
  explicit Application(std::shared_ptr<util::Environment> environment);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;
  util::Environment& environment();

  // Valid once the command callback has started
  const config::Settings& settings() const;

  // Valid only for commands whose needsServices() is true
  app::Services& services();

 private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  // Settings and logging; cheap, runs for every command
  Result<void> initializeSettings();
  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;

  std::shared_ptr<util::Environment> environment_;
  std::optional<config::Settings> settings_;
  std::unique_ptr<app::Services> services_;

  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace attic::cli
