#include "attic/archive/compressor.hpp"

#include <spdlog/spdlog.h>

#include "attic/util/filesystem.hpp"

namespace attic::archive {

Compressor::Compressor(std::shared_ptr<ImageCodec> codec, std::filesystem::path staging_dir)
    : codec_(std::move(codec)), staging_dir_(std::move(staging_dir)) {}

Result<CompressionResult> Compressor::fitToLimit(const std::filesystem::path& path,
                                                 std::uint64_t bytes_limit,
                                                 MediaKind kind) const {
  auto size_result = util::FileSystem::fileSize(path);
  if (!size_result) {
    return std::unexpected(size_result.error());
  }
  const std::uint64_t original_size = *size_result;

  if (original_size <= bytes_limit) {
    return CompressionResult{path, {original_size, original_size}, std::nullopt};
  }

  auto uncompressible = [&](const std::string& why) {
    return std::unexpected(makeError(
        ErrorCode::kSizeLimitUncompressible,
        path.filename().string() + " is " + std::to_string(original_size) +
            " bytes, over the " + std::to_string(bytes_limit) + " byte limit, and " + why));
  };

  if (kind != MediaKind::kImages) {
    return uncompressible(std::string(mediaKindToString(kind)) + " cannot be re-encoded");
  }
  if (!codec_ || !codec_->supports(path)) {
    return uncompressible("its image format cannot be re-encoded");
  }

  auto image = codec_->decode(path);
  if (!image) {
    return uncompressible("it could not be decoded (" + image.error().message() + ")");
  }

  std::string encoded;
  int quality = kStartQuality;
  while (true) {
    auto attempt = codec_->encodeJpeg(*image, quality);
    if (!attempt) {
      return std::unexpected(attempt.error());
    }
    encoded = std::move(*attempt);
    spdlog::debug("Re-encoded {} at quality {}: {} bytes", path.filename().string(), quality,
                  encoded.size());

    if (encoded.size() <= bytes_limit || quality <= kQualityFloor) {
      break;
    }
    quality -= kQualityStep;
  }

  auto dir_result = util::FileSystem::createDirectories(staging_dir_);
  if (!dir_result) {
    return std::unexpected(dir_result.error());
  }

  std::filesystem::path output = staging_dir_ / (path.stem().string() + "-" +
                                                 util::FileSystem::randomSuffix() + ".jpg");
  auto write_result = util::FileSystem::writeFileAtomic(output, encoded);
  if (!write_result) {
    return std::unexpected(write_result.error());
  }

  if (encoded.size() > bytes_limit) {
    spdlog::warn("{} still {} bytes at quality floor {}; keeping best effort",
                 path.filename().string(), encoded.size(), kQualityFloor);
  }

  return CompressionResult{output, {original_size, encoded.size()}, quality};
}

}  // namespace attic::archive
