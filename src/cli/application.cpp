#include "attic/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "attic/cli/command_error_handler.hpp"
#include "attic/util/logging.hpp"

// Command includes
#include "attic/cli/commands/archive_command.hpp"
#include "attic/cli/commands/check_command.hpp"
#include "attic/cli/commands/hash_command.hpp"
#include "attic/cli/commands/limits_command.hpp"
#include "attic/cli/commands/rehydrate_command.hpp"
#include "attic/cli/commands/route_command.hpp"
#include "attic/cli/commands/search_command.hpp"
#include "attic/cli/commands/serve_command.hpp"
#include "attic/cli/commands/stats_command.hpp"
#include "attic/cli/commands/tag_command.hpp"

namespace attic::cli {

Application::Application() : Application(std::make_shared<util::ProcessEnvironment>()) {}

Application::Application(std::shared_ptr<util::Environment> environment)
    : app_("attic", "Archive media files to chat attachment storage"),
      environment_(std::move(environment)) {
  app_.set_version_flag("--version", getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  }

  // The command has already been executed by CLI11's callback system
  return kExitOk;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Debug output on stderr");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  // Archival pipeline
  registerCommand(std::make_unique<ArchiveCommand>(*this));
  registerCommand(std::make_unique<RehydrateCommand>(*this));

  // Manifest queries
  registerCommand(std::make_unique<SearchCommand>(*this));
  registerCommand(std::make_unique<TagCommand>(*this));
  registerCommand(std::make_unique<StatsCommand>(*this));

  // Dry-run helpers
  registerCommand(std::make_unique<HashCommand>(*this));
  registerCommand(std::make_unique<LimitsCommand>(*this));
  registerCommand(std::make_unique<RouteCommand>(*this));
  registerCommand(std::make_unique<CheckCommand>(*this));

  // HTTP façade
  registerCommand(std::make_unique<ServeCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  attic archive ./clip.mp4 --tag demo --visibility private
  attic rehydrate 3f2a...e9 --json
  attic search --tag demo --limit 20
  attic limits --target 123456789012345678
  attic serve

For more information on a specific command, run:
  attic <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler errors(global_options_);

    auto settings_result = initializeSettings();
    if (!settings_result.has_value()) {
      throw CLI::RuntimeError(errors.handleError(settings_result.error(), "load settings"));
    }

    if (cmd_ptr->needsServices()) {
      auto services_result = initializeServices();
      if (!services_result.has_value()) {
        throw CLI::RuntimeError(errors.handleError(services_result.error(), "initialize"));
      }
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(errors.handleError(result.error(), cmd_ptr->name()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeSettings() {
  if (settings_.has_value()) {
    return {};
  }

  std::optional<std::filesystem::path> config_path;
  if (!global_options_.config_file.empty()) {
    config_path = global_options_.config_file;
  }

  auto loaded = app::ServiceFactory::loadSettings(config_path, *environment_);
  if (!loaded.has_value()) {
    // Still log to the console so the failure is visible
    util::setupLogging(util::LoggingSettings{});
    return std::unexpected(loaded.error());
  }
  settings_ = std::move(*loaded);

  util::LoggingSettings logging;
  logging.level = settings_->logging.level;
  logging.file = settings_->logging.file;
  if (global_options_.verbose > 0) {
    logging.console_level = "debug";
  } else if (global_options_.quiet) {
    logging.console_level = "error";
  }
  util::setupLogging(logging);

  spdlog::debug("Using config {}", config_path.value_or(config::Settings::defaultConfigPath()).string());
  return {};
}

Result<void> Application::initializeServices() {
  if (services_) {
    return {};
  }

  auto services = app::ServiceFactory::create(*settings_, environment_);
  if (!services.has_value()) {
    return std::unexpected(services.error());
  }
  services_ = std::move(*services);
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

util::Environment& Application::environment() {
  return *environment_;
}

const config::Settings& Application::settings() const {
  if (!settings_.has_value()) {
    throw std::runtime_error("Settings not loaded");
  }
  return *settings_;
}

app::Services& Application::services() {
  if (!services_) {
    throw std::runtime_error("Services not initialized");
  }
  return *services_;
}

}  // namespace attic::cli
