#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "attic/archive/route_table.hpp"
#include "attic/archive/types.hpp"
#include "attic/common.hpp"

namespace attic::archive {

// Maps a file to its storage destination using a shared RouteTable
class ChannelRouter {
 public:
  explicit ChannelRouter(std::shared_ptr<const RouteTable> table,
                         KindExtensions kinds = defaultKindExtensions());

  // Classify by extension; unmatched extensions are blobs
  MediaKind kindFromPath(const std::filesystem::path& path) const;

  // Tenant override first, then the default entry. Missing entry is kConfigError.
  Result<RouteDecision> pickChannel(const std::filesystem::path& path,
                                    const std::optional<std::string>& tenant,
                                    const std::string& visibility) const;

  Result<RouteDecision> pickChannel(const std::filesystem::path& path,
                                    const ArchiveMeta& meta) const {
    return pickChannel(path, meta.tenant, meta.visibility);
  }

  // Same precedence for an already classified kind (stored records)
  Result<RouteDecision> routeFor(MediaKind kind, const std::optional<std::string>& tenant,
                                 const std::string& visibility) const;

 private:
  std::shared_ptr<const RouteTable> table_;
  KindExtensions kinds_;
};

}  // namespace attic::archive
