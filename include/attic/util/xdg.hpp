#pragma once

#include <filesystem>
#include <string>

namespace attic::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/attic)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/attic)
  static std::filesystem::path configHome();

  // Get XDG cache home directory (~/.cache/attic)
  static std::filesystem::path cacheHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get manifest database path
  static std::filesystem::path manifestFile();

  // Get route table path
  static std::filesystem::path routesFile();

  // Get staging directory for uploads and re-encoded artifacts
  static std::filesystem::path stagingDir();

  // Get log file path
  static std::filesystem::path logFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace attic::util
