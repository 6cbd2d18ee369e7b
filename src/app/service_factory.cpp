#include "attic/app/service_factory.hpp"

#include <spdlog/spdlog.h>

#include "attic/archive/sqlite_manifest.hpp"
#include "attic/util/http_client.hpp"

namespace attic::app {

Result<config::Settings> ServiceFactory::loadSettings(
    const std::optional<std::filesystem::path>& path, const util::Environment& env) {
  auto settings = path.has_value() ? config::Settings::load(*path, env)
                                   : config::Settings::loadDefault(env);
  if (!settings) {
    return std::unexpected(settings.error());
  }

  auto valid = settings->validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return settings;
}

archive::TransportFactory ServiceFactory::defaultTransportFactory(long timeout_seconds) {
  return [timeout_seconds]() -> std::unique_ptr<util::HttpTransport> {
    return std::make_unique<util::HttpClient>(timeout_seconds);
  };
}

Result<std::unique_ptr<Services>> ServiceFactory::create(
    config::Settings settings,
    std::shared_ptr<util::Environment> environment,
    archive::TransportFactory transport_factory,
    std::shared_ptr<archive::ContentPolicy> content_policy,
    std::shared_ptr<archive::ImageCodec> codec) {
  if (!environment) {
    environment = std::make_shared<util::ProcessEnvironment>();
  }
  if (!transport_factory) {
    transport_factory = defaultTransportFactory(settings.provider.timeout_seconds);
  }
  if (!codec) {
    codec = std::make_shared<archive::JpegImageCodec>();
  }

  auto routes = archive::RouteTable::loadFile(settings.routes_file);
  if (!routes) {
    return std::unexpected(routes.error());
  }

  auto services = std::make_unique<Services>();
  services->environment = std::move(environment);
  services->settings = std::move(settings);
  const auto& cfg = services->settings;

  services->routes = std::make_shared<const archive::RouteTable>(std::move(*routes));
  services->policy = std::make_shared<archive::PolicyEngine>(cfg.policy, std::move(content_policy));
  services->router = std::make_shared<archive::ChannelRouter>(services->routes, cfg.policy.allow);
  services->limits = std::make_shared<archive::SizeLimitDetector>(*services->environment);

  auto manifest = std::make_shared<archive::SqliteManifest>(cfg.manifest_path);
  auto init = manifest->initialize();
  if (!init) {
    return std::unexpected(init.error());
  }
  services->manifest = manifest;

  archive::ArchiverOptions options;
  options.enabled = cfg.enabled;
  options.allow_fallback = cfg.provider.allow_fallback;
  options.bot_token = cfg.provider.bot_token;
  options.default_webhook = cfg.provider.default_webhook;

  archive::ArchiverServices collaborators;
  collaborators.policy = services->policy;
  collaborators.router = services->router;
  collaborators.limits = services->limits;
  collaborators.compressor = std::make_shared<archive::Compressor>(std::move(codec), cfg.staging_dir);
  collaborators.manifest = services->manifest;
  collaborators.uploader =
      std::make_shared<archive::ChatUploader>(cfg.provider.api_base, transport_factory);
  collaborators.rehydrator =
      std::make_shared<archive::Rehydrator>(cfg.provider.api_base, transport_factory);
  collaborators.cleanup = std::make_shared<archive::CleanupManager>();

  services->archiver = std::make_shared<archive::Archiver>(options, std::move(collaborators));

  spdlog::debug("Services ready (archiver {}, manifest {})", cfg.enabled ? "enabled" : "disabled",
                cfg.manifest_path.string());
  return services;
}

}  // namespace attic::app
