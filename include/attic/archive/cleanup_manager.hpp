#pragma once

#include <filesystem>
#include <vector>

#include "attic/common.hpp"

namespace attic::archive {

// Removes local copies once their bytes are archived
class CleanupManager {
 public:
  // Idempotent: a missing file is success
  Result<void> remove(const std::filesystem::path& path) const;

  // Best effort over a set of paths; failures are logged, not returned.
  // Returns how many paths failed.
  std::size_t removeAll(const std::vector<std::filesystem::path>& paths) const;
};

}  // namespace attic::archive
