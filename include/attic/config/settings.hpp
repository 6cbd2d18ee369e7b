#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "attic/archive/types.hpp"
#include "attic/common.hpp"
#include "attic/util/environment.hpp"

namespace attic::config {

struct ProviderSettings {
  std::string api_base = "https://discord.com/api/v10";
  std::string bot_token;
  std::string default_webhook;
  bool allow_fallback = false;
  long timeout_seconds = 60;
};

struct ServerSettings {
  std::string bind = "127.0.0.1";
  int port = 8787;
  std::string api_token;
  std::uint64_t max_body_bytes = 64ULL * 1024 * 1024;
};

struct PolicySettings {
  std::uint64_t max_file_bytes = 100ULL * 1024 * 1024;
  std::vector<std::string> deny_extensions = archive::defaultDeniedExtensions();
  archive::KindExtensions allow = archive::defaultKindExtensions();
};

struct LogSettings {
  std::string level = "info";
  std::filesystem::path file;
};

/**
 * @brief Process configuration
 *
 * Loaded once at startup from TOML, then overlaid with environment
 * variables. Size-limit overrides are absent; the
 * SizeLimitDetector reads those on every call.
 */
class Settings {
 public:
  // Defaults rooted in the XDG directories
  Settings();

  bool enabled = false;
  std::filesystem::path data_dir;
  std::filesystem::path manifest_path;
  std::filesystem::path routes_file;
  std::filesystem::path staging_dir;

  ProviderSettings provider;
  ServerSettings server;
  PolicySettings policy;
  LogSettings logging;

  // Load from a TOML file, then apply environment overrides
  static Result<Settings> load(const std::filesystem::path& path, const util::Environment& env);

  // Load the default config file if it exists; defaults otherwise
  static Result<Settings> loadDefault(const util::Environment& env);

  // Parse TOML text (no environment overlay)
  static Result<Settings> parse(const std::string& text, const util::Environment& env);

  // Overlay ENABLE_DISCORD_ARCHIVER, DISCORD_BOT_TOKEN and friends
  Result<void> applyEnvironment(const util::Environment& env);

  Result<void> validate() const;

  static std::filesystem::path defaultConfigPath();
};

}  // namespace attic::config
