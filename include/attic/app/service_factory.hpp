#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "attic/archive/archiver.hpp"
#include "attic/archive/route_table.hpp"
#include "attic/common.hpp"
#include "attic/config/settings.hpp"
#include "attic/util/environment.hpp"

namespace attic::app {

/**
 * @brief Everything a command or the server needs, built once at startup
 *
 * Members reference each other (the router holds the route table, the
 * size-limit detector holds the environment), so keep the Services
 * object alive for as long as any member is in use.
 */
struct Services {
  std::shared_ptr<util::Environment> environment;
  config::Settings settings;
  std::shared_ptr<const archive::RouteTable> routes;
  std::shared_ptr<archive::PolicyEngine> policy;
  std::shared_ptr<archive::ChannelRouter> router;
  std::shared_ptr<archive::SizeLimitDetector> limits;
  std::shared_ptr<archive::Manifest> manifest;
  std::shared_ptr<archive::Archiver> archiver;
};

class ServiceFactory {
 public:
  // Explicit path must exist; otherwise the default config file is optional
  static Result<config::Settings> loadSettings(const std::optional<std::filesystem::path>& path,
                                               const util::Environment& env);

  // Route table, manifest and archiver wired from settings; the route table
  // file must exist
  static Result<std::unique_ptr<Services>> create(
      config::Settings settings,
      std::shared_ptr<util::Environment> environment,
      archive::TransportFactory transport_factory = {},
      std::shared_ptr<archive::ContentPolicy> content_policy = {},
      std::shared_ptr<archive::ImageCodec> codec = {});

  // libcurl transports using the provider timeout
  static archive::TransportFactory defaultTransportFactory(long timeout_seconds);

 private:
  ServiceFactory() = delete;
};

}  // namespace attic::app
