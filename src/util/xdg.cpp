#include "attic/util/xdg.hpp"

#include <cstdlib>

namespace attic::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "attic";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".attic_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "attic";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "attic";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".attic_config";
  }

  return std::filesystem::path(home) / ".config" / "attic";
}

std::filesystem::path Xdg::cacheHome() {
  std::string xdg_cache_home = getEnvVar("XDG_CACHE_HOME", "");
  if (!xdg_cache_home.empty()) {
    return std::filesystem::path(xdg_cache_home) / "attic";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".attic_cache";
  }

  return std::filesystem::path(home) / ".cache" / "attic";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::manifestFile() {
  return dataHome() / "archive_manifest.db";
}

std::filesystem::path Xdg::routesFile() {
  return configHome() / "routes.yaml";
}

std::filesystem::path Xdg::stagingDir() {
  return cacheHome() / "staging";
}

std::filesystem::path Xdg::logFile() {
  return dataHome() / "logs" / "attic.log";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace attic::util
