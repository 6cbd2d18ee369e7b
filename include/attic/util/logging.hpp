#pragma once

#include <filesystem>
#include <string>

namespace attic::util {

struct LoggingSettings {
  std::string level = "info";          // trace, debug, info, warn, error, critical, off
  std::filesystem::path file;          // Empty disables the file sink
  bool console = true;                 // stderr sink
  std::string console_level = "warn";  // Threshold for the stderr sink
};

// Install the process-wide "attic" logger. Safe to call more than once;
// later calls replace the sinks.
void setupLogging(const LoggingSettings& settings);

}  // namespace attic::util
