#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "attic/archive/image_codec.hpp"
#include "attic/archive/types.hpp"
#include "attic/common.hpp"

namespace attic::archive {

struct CompressionResult {
  std::filesystem::path output_path;  // Same as the input when passed through
  CompressionStats stats;
  std::optional<int> quality;         // Set only when the file was re-encoded

  bool reencoded() const { return quality.has_value(); }
};

/**
 * @brief Fits a file under a byte ceiling
 *
 * Images are re-encoded as JPEG from quality 85 downwards in steps of 5,
 * stopping at the first fit or at the floor of 35, whichever comes
 * first. The floor result is returned even if it is still over the
 * limit. Other kinds pass through when they fit and fail with
 * kSizeLimitUncompressible when they don't.
 */
class Compressor {
 public:
  static constexpr int kStartQuality = 85;
  static constexpr int kQualityStep = 5;
  static constexpr int kQualityFloor = 35;

  Compressor(std::shared_ptr<ImageCodec> codec, std::filesystem::path staging_dir);

  Result<CompressionResult> fitToLimit(const std::filesystem::path& path,
                                       std::uint64_t bytes_limit,
                                       MediaKind kind) const;

 private:
  std::shared_ptr<ImageCodec> codec_;
  std::filesystem::path staging_dir_;
};

}  // namespace attic::archive
