#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "attic/common.hpp"

namespace attic::archive {

// Streaming SHA-256 over a file, lower-case hex
class ContentHasher {
 public:
  static constexpr std::size_t kChunkSize = 1024 * 1024;

  static Result<std::string> computeHash(const std::filesystem::path& path);

  // Whether `value` looks like a digest this hasher produces
  static bool isValidHash(const std::string& value);
};

}  // namespace attic::archive
