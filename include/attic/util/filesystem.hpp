#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "attic/common.hpp"

namespace attic::util {

// Filesystem helpers for staging, re-encoded artifacts and cleanup
class FileSystem {
 public:
  // Temp file beside the target, fsync, rename over the target. Parents are created.
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  static Result<std::uintmax_t> fileSize(const std::filesystem::path& path);

  // Remove file; a missing file is not an error
  static Result<void> removeFile(const std::filesystem::path& path);

  // Random [a-z0-9] suffix for staging file names
  static std::string randomSuffix(std::size_t length = 8);

  // Strip directory components and characters unsafe in a file name
  static std::string sanitizeFilename(const std::string& name);
};

}  // namespace attic::util
