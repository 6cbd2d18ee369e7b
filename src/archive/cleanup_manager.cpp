#include "attic/archive/cleanup_manager.hpp"

#include <set>

#include <spdlog/spdlog.h>

#include "attic/util/filesystem.hpp"

namespace attic::archive {

Result<void> CleanupManager::remove(const std::filesystem::path& path) const {
  if (path.empty()) {
    return {};
  }
  auto result = util::FileSystem::removeFile(path);
  if (result) {
    spdlog::debug("Removed local copy {}", path.string());
  }
  return result;
}

std::size_t CleanupManager::removeAll(const std::vector<std::filesystem::path>& paths) const {
  std::set<std::filesystem::path> unique;
  for (const auto& path : paths) {
    if (!path.empty()) {
      unique.insert(path.lexically_normal());
    }
  }

  std::size_t failures = 0;
  for (const auto& path : unique) {
    auto result = remove(path);
    if (!result) {
      ++failures;
      spdlog::warn("Cleanup of {} failed: {}", path.string(), result.error().message());
    }
  }
  return failures;
}

}  // namespace attic::archive
