#include "attic/archive/route_table.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace attic::archive {

namespace {

Result<RouteDecision> parseEntry(const YAML::Node& node, const std::string& where) {
  if (!node.IsMap() || !node["channel_id"]) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Route " + where + " has no channel_id"));
  }

  RouteDecision decision;
  decision.channel_id = node["channel_id"].as<std::string>();
  if (decision.channel_id.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Route " + where + " has an empty channel_id"));
  }
  if (node["thread_id"] && !node["thread_id"].IsNull()) {
    decision.thread_id = node["thread_id"].as<std::string>();
  }
  if (node["webhook_url"] && !node["webhook_url"].IsNull()) {
    decision.webhook_url = node["webhook_url"].as<std::string>();
  }
  return decision;
}

Result<RouteTable::KindRoutes> parseKinds(const YAML::Node& node, const std::string& where) {
  RouteTable::KindRoutes kinds;
  if (!node || node.IsNull()) {
    return kinds;
  }
  if (!node.IsMap()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, where + " must be a mapping"));
  }

  for (const auto& kind_pair : node) {
    std::string kind_name = kind_pair.first.as<std::string>();
    auto kind = mediaKindFromString(kind_name);
    if (!kind.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Unknown media kind '" + kind_name + "' in " + where));
    }
    if (!kind_pair.second.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       where + "." + kind_name + " must be a mapping"));
    }

    auto& visibilities = kinds[*kind];
    for (const auto& vis_pair : kind_pair.second) {
      std::string visibility = vis_pair.first.as<std::string>();
      auto entry = parseEntry(vis_pair.second, where + "." + kind_name + "." + visibility);
      if (!entry) {
        return std::unexpected(entry.error());
      }
      visibilities[visibility] = std::move(*entry);
    }
  }
  return kinds;
}

const RouteDecision* lookup(const RouteTable::KindRoutes& kinds, MediaKind kind,
                            const std::string& visibility) {
  auto kind_it = kinds.find(kind);
  if (kind_it == kinds.end()) {
    return nullptr;
  }
  auto vis_it = kind_it->second.find(visibility);
  return vis_it == kind_it->second.end() ? nullptr : &vis_it->second;
}

}  // namespace

Result<RouteTable> RouteTable::parse(const std::string& yaml) {
  try {
    YAML::Node root = YAML::Load(yaml);
    if (!root.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Route table must be a mapping with a 'routes' key"));
    }
    if (!root["routes"]) {
      return std::unexpected(makeError(ErrorCode::kConfigError, "Route table has no 'routes' key"));
    }

    auto routes = parseKinds(root["routes"], "routes");
    if (!routes) {
      return std::unexpected(routes.error());
    }

    std::map<std::string, KindRoutes> overrides;
    const YAML::Node tenants = root["per_tenant_overrides"];
    if (tenants && !tenants.IsNull()) {
      if (!tenants.IsMap()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "per_tenant_overrides must be a mapping"));
      }
      for (const auto& tenant_pair : tenants) {
        std::string tenant = tenant_pair.first.as<std::string>();
        auto kinds = parseKinds(tenant_pair.second, "per_tenant_overrides." + tenant);
        if (!kinds) {
          return std::unexpected(kinds.error());
        }
        overrides[tenant] = std::move(*kinds);
      }
    }

    return RouteTable(std::move(*routes), std::move(overrides));

  } catch (const YAML::Exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Route table YAML error: " + std::string(e.what())));
  }
}

Result<RouteTable> RouteTable::loadFile(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Route table not found: " + path.string()));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto table = parse(buffer.str());
  if (table) {
    spdlog::debug("Loaded route table {} ({} kinds, {} tenant overrides)", path.string(),
                  table->routes().size(), table->tenantOverrides().size());
  }
  return table;
}

const RouteDecision* RouteTable::find(MediaKind kind, const std::string& visibility) const {
  return lookup(routes_, kind, visibility);
}

const RouteDecision* RouteTable::findOverride(const std::string& tenant, MediaKind kind,
                                              const std::string& visibility) const {
  auto it = tenant_overrides_.find(tenant);
  if (it == tenant_overrides_.end()) {
    return nullptr;
  }
  return lookup(it->second, kind, visibility);
}

}  // namespace attic::archive
