#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>

#include "attic/archive/types.hpp"
#include "attic/common.hpp"

namespace attic::archive {

/**
 * @brief Immutable (kind, visibility[, tenant]) -> destination table
 *
 * YAML shape:
 * @code
 * routes:
 *   images:
 *     public: { channel_id: "111", thread_id: "9001", webhook_url: "https://..." }
 * per_tenant_overrides:
 *   acme:
 *     images:
 *       public: { channel_id: "555" }
 * @endcode
 */
class RouteTable {
 public:
  using VisibilityRoutes = std::map<std::string, RouteDecision>;
  using KindRoutes = std::map<MediaKind, VisibilityRoutes>;

  RouteTable() = default;
  RouteTable(KindRoutes routes, std::map<std::string, KindRoutes> tenant_overrides)
      : routes_(std::move(routes)), tenant_overrides_(std::move(tenant_overrides)) {}

  static Result<RouteTable> loadFile(const std::filesystem::path& path);
  static Result<RouteTable> parse(const std::string& yaml);

  // Default table entry, or nullptr
  const RouteDecision* find(MediaKind kind, const std::string& visibility) const;

  // Tenant-specific entry, or nullptr
  const RouteDecision* findOverride(const std::string& tenant, MediaKind kind,
                                    const std::string& visibility) const;

  const KindRoutes& routes() const { return routes_; }
  const std::map<std::string, KindRoutes>& tenantOverrides() const { return tenant_overrides_; }

 private:
  KindRoutes routes_;
  std::map<std::string, KindRoutes> tenant_overrides_;
};

}  // namespace attic::archive
