#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "attic/util/environment.hpp"

namespace attic::archive {

/**
 * @brief Resolves the provider's per-attachment byte ceiling
 *
 * Resolution, most specific first:
 *   1. ARCHIVER_LIMIT_<TARGET>_BOT / ARCHIVER_LIMIT_<TARGET>_WEBHOOK
 *   2. ARCHIVER_WEBHOOK_LIMIT_BYTES (fallback mode only)
 *   3. ARCHIVER_LIMIT_BYTES
 *   4. kDefaultLimitBytes
 *
 * Variables are read on every call so changes apply without a restart.
 */
class SizeLimitDetector {
 public:
  static constexpr std::uint64_t kDefaultLimitBytes = 10ULL * 1024 * 1024;

  explicit SizeLimitDetector(const util::Environment& env) : env_(env) {}

  std::uint64_t detect(const std::optional<std::string>& target_id = std::nullopt,
                       bool use_bot = true) const;

  // Variable name for a per-target override; non-alphanumerics become '_'
  static std::string targetVariable(const std::string& target_id, bool use_bot);

 private:
  std::optional<std::uint64_t> readLimit(const std::string& name) const;

  const util::Environment& env_;
};

}  // namespace attic::archive
