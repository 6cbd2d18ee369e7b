#include "attic/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "attic/util/xdg.hpp"

namespace attic::config {

namespace {

std::string resolveEnvVar(const std::string& value, const util::Environment& env) {
  if (value.substr(0, 4) == "env:") {
    return env.get(value.substr(4)).value_or("");
  }
  return value;
}

std::string normalizeConfiguredExtension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

std::vector<std::string> readExtensions(const toml::array& array) {
  std::vector<std::string> result;
  for (const auto& item : array) {
    if (auto ext = item.value<std::string>()) {
      auto normalized = normalizeConfiguredExtension(*ext);
      if (!normalized.empty()) {
        result.push_back(std::move(normalized));
      }
    }
  }
  return result;
}

Result<std::uint64_t> parsePositive(const std::string& name, const std::string& text) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     name + " must be a positive integer, got: " + text));
  }
  return value;
}

Result<void> readTable(const toml::table& config_data, Settings& settings,
                       const util::Environment& env) {
  if (auto value = config_data["enabled"].value<bool>()) {
    settings.enabled = *value;
  }
  if (auto value = config_data["data_dir"].value<std::string>()) {
    settings.data_dir = *value;
  }
  if (auto value = config_data["manifest_path"].value<std::string>()) {
    settings.manifest_path = *value;
  }
  if (auto value = config_data["routes_file"].value<std::string>()) {
    settings.routes_file = *value;
  }
  if (auto value = config_data["staging_dir"].value<std::string>()) {
    settings.staging_dir = *value;
  }

  if (auto provider_table = config_data["provider"].as_table()) {
    if (auto value = (*provider_table)["api_base"].value<std::string>()) {
      settings.provider.api_base = *value;
    }
    if (auto value = (*provider_table)["bot_token"].value<std::string>()) {
      settings.provider.bot_token = resolveEnvVar(*value, env);
    }
    if (auto value = (*provider_table)["default_webhook"].value<std::string>()) {
      settings.provider.default_webhook = resolveEnvVar(*value, env);
    }
    if (auto value = (*provider_table)["allow_fallback"].value<bool>()) {
      settings.provider.allow_fallback = *value;
    }
    if (auto value = (*provider_table)["timeout_seconds"].value<int64_t>()) {
      settings.provider.timeout_seconds = static_cast<long>(*value);
    }
  }

  if (auto server_table = config_data["server"].as_table()) {
    if (auto value = (*server_table)["bind"].value<std::string>()) {
      settings.server.bind = *value;
    }
    if (auto value = (*server_table)["port"].value<int64_t>()) {
      settings.server.port = static_cast<int>(*value);
    }
    if (auto value = (*server_table)["api_token"].value<std::string>()) {
      settings.server.api_token = resolveEnvVar(*value, env);
    }
    if (auto value = (*server_table)["max_body_bytes"].value<int64_t>()) {
      if (*value <= 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "server.max_body_bytes must be positive"));
      }
      settings.server.max_body_bytes = static_cast<std::uint64_t>(*value);
    }
  }

  if (auto policy_table = config_data["policy"].as_table()) {
    if (auto value = (*policy_table)["max_file_bytes"].value<int64_t>()) {
      if (*value <= 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "policy.max_file_bytes must be positive"));
      }
      settings.policy.max_file_bytes = static_cast<std::uint64_t>(*value);
    }
    if (auto deny = (*policy_table)["deny_extensions"].as_array()) {
      settings.policy.deny_extensions = readExtensions(*deny);
    }
    if (auto allow_table = (*policy_table)["allow"].as_table()) {
      for (const auto& [key, node] : *allow_table) {
        auto kind = archive::mediaKindFromString(key.str());
        if (!kind.has_value() || *kind == archive::MediaKind::kBlobs) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "Unknown media kind in policy.allow: " +
                                               std::string(key.str())));
        }
        if (auto list = node.as_array()) {
          settings.policy.allow[*kind] = readExtensions(*list);
        }
      }
    }
  }

  if (auto logging_table = config_data["logging"].as_table()) {
    if (auto value = (*logging_table)["level"].value<std::string>()) {
      settings.logging.level = *value;
    }
    if (auto value = (*logging_table)["file"].value<std::string>()) {
      settings.logging.file = *value;
    }
  }

  return {};
}

}  // namespace

Settings::Settings() {
  data_dir = util::Xdg::dataHome();
  manifest_path = util::Xdg::manifestFile();
  routes_file = util::Xdg::routesFile();
  staging_dir = util::Xdg::stagingDir();
  logging.file = util::Xdg::logFile();
}

Result<Settings> Settings::parse(const std::string& text, const util::Environment& env) {
  Settings settings;
  try {
    auto config_data = toml::parse(text);
    auto read_result = readTable(config_data, settings, env);
    if (!read_result) {
      return std::unexpected(read_result.error());
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
  return settings;
}

Result<Settings> Settings::load(const std::filesystem::path& path, const util::Environment& env) {
  if (!std::filesystem::exists(path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + path.string()));
  }

  Settings settings;
  try {
    auto config_data = toml::parse_file(path.string());
    auto read_result = readTable(config_data, settings, env);
    if (!read_result) {
      return std::unexpected(read_result.error());
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error in " + path.string() + ": " + e.what()));
  }

  auto env_result = settings.applyEnvironment(env);
  if (!env_result) {
    return std::unexpected(env_result.error());
  }

  spdlog::debug("Loaded settings from {}", path.string());
  return settings;
}

Result<Settings> Settings::loadDefault(const util::Environment& env) {
  auto path = defaultConfigPath();
  if (std::filesystem::exists(path)) {
    return load(path, env);
  }

  Settings settings;
  auto env_result = settings.applyEnvironment(env);
  if (!env_result) {
    return std::unexpected(env_result.error());
  }
  return settings;
}

Result<void> Settings::applyEnvironment(const util::Environment& env) {
  if (auto value = env.getBool("ENABLE_DISCORD_ARCHIVER")) {
    enabled = *value;
  }
  if (auto value = env.getBool("ARCHIVER_ALLOW_WEBHOOK_FALLBACK")) {
    provider.allow_fallback = *value;
  }
  if (auto value = env.get("DISCORD_BOT_TOKEN"); value && !value->empty()) {
    provider.bot_token = *value;
  }
  if (auto value = env.get("DISCORD_WEBHOOK"); value && !value->empty()) {
    provider.default_webhook = *value;
  }
  if (auto value = env.get("ARCHIVER_API_TOKEN"); value && !value->empty()) {
    server.api_token = *value;
  }
  if (auto value = env.get("ARCHIVE_DB_PATH"); value && !value->empty()) {
    manifest_path = *value;
  }
  if (auto value = env.get("ARCHIVER_ROUTES_FILE"); value && !value->empty()) {
    routes_file = *value;
  }
  if (auto value = env.get("ARCHIVER_POLICY_MAX_BYTES"); value && !value->empty()) {
    auto parsed = parsePositive("ARCHIVER_POLICY_MAX_BYTES", *value);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    policy.max_file_bytes = *parsed;
  }
  return {};
}

Result<void> Settings::validate() const {
  if (manifest_path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Manifest path is empty"));
  }

  if (server.port <= 0 || server.port > 65535) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid server port: " + std::to_string(server.port)));
  }

  if (policy.max_file_bytes == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "policy.max_file_bytes must be positive"));
  }

  if (provider.api_base.rfind("http://", 0) != 0 && provider.api_base.rfind("https://", 0) != 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "provider.api_base must be an http(s) URL: " + provider.api_base));
  }

  if (provider.timeout_seconds <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "provider.timeout_seconds must be positive"));
  }

  return {};
}

std::filesystem::path Settings::defaultConfigPath() {
  return util::Xdg::configFile();
}

}  // namespace attic::config
