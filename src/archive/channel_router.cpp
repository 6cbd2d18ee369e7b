#include "attic/archive/channel_router.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace attic::archive {

ChannelRouter::ChannelRouter(std::shared_ptr<const RouteTable> table, KindExtensions kinds)
    : table_(std::move(table)), kinds_(std::move(kinds)) {
  if (!table_) {
    throw std::invalid_argument("ChannelRouter requires a route table");
  }
}

MediaKind ChannelRouter::kindFromPath(const std::filesystem::path& path) const {
  std::string ext = normalizeExtension(path);
  if (ext.empty()) {
    return MediaKind::kBlobs;
  }
  for (const auto& [kind, extensions] : kinds_) {
    if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
      return kind;
    }
  }
  return MediaKind::kBlobs;
}

Result<RouteDecision> ChannelRouter::pickChannel(const std::filesystem::path& path,
                                                 const std::optional<std::string>& tenant,
                                                 const std::string& visibility) const {
  MediaKind kind = kindFromPath(path);
  auto route = routeFor(kind, tenant, visibility);
  if (route) {
    spdlog::debug("Routed {} ({}/{}) -> {}", path.filename().string(), mediaKindToString(kind),
                  visibility, route->channel_id);
  }
  return route;
}

Result<RouteDecision> ChannelRouter::routeFor(MediaKind kind,
                                              const std::optional<std::string>& tenant,
                                              const std::string& visibility) const {
  if (tenant.has_value() && !tenant->empty()) {
    if (const auto* entry = table_->findOverride(*tenant, kind, visibility)) {
      spdlog::debug("Tenant override {} applies to {}/{}", *tenant, mediaKindToString(kind),
                    visibility);
      return *entry;
    }
  }

  if (const auto* entry = table_->find(kind, visibility)) {
    return *entry;
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "No route for kind '" + std::string(mediaKindToString(kind)) +
                                       "' with visibility '" + visibility + "'"));
}

}  // namespace attic::archive
