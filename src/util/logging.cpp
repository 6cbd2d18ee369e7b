#include "attic/util/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace attic::util {

void setupLogging(const LoggingSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;

  if (settings.console) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::from_str(settings.console_level));
    sinks.push_back(console_sink);
  }

  std::string file_error;
  if (!settings.file.empty()) {
    try {
      if (settings.file.has_parent_path()) {
        std::filesystem::create_directories(settings.file.parent_path());
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          settings.file.string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
      file_sink->set_level(spdlog::level::from_str(settings.level));
      sinks.push_back(file_sink);
    } catch (const std::exception& e) {
      // Fallback to console-only logging if file setup fails
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("attic", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  // Logger threshold is the more verbose of the two sinks
  logger->set_level(std::min(spdlog::level::from_str(settings.level),
                             spdlog::level::from_str(settings.console_level)));
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

}  // namespace attic::util
