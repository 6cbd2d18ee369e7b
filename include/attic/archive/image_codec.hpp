#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "attic/common.hpp"

namespace attic::archive {

// 8-bit interleaved RGB pixels, row-major, no padding
struct RasterImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels;
};

// Lossy re-encoding backend used by the Compressor
class ImageCodec {
 public:
  virtual ~ImageCodec() = default;

  // Whether decode() understands this file
  virtual bool supports(const std::filesystem::path& path) const = 0;

  virtual Result<RasterImage> decode(const std::filesystem::path& path) = 0;

  // Baseline JPEG from raw pixels; carries no source metadata
  virtual Result<std::string> encodeJpeg(const RasterImage& image, int quality) = 0;
};

/**
 * @brief libpng + libjpeg codec
 *
 * Decodes PNG and JPEG. Alpha is composited over white. Output never
 * contains EXIF, ICC, XMP or text chunks since only pixels are written.
 */
class JpegImageCodec : public ImageCodec {
 public:
  bool supports(const std::filesystem::path& path) const override;
  Result<RasterImage> decode(const std::filesystem::path& path) override;
  Result<std::string> encodeJpeg(const RasterImage& image, int quality) override;

 private:
  Result<RasterImage> decodePng(const std::filesystem::path& path);
  Result<RasterImage> decodeJpeg(const std::filesystem::path& path);
};

}  // namespace attic::archive
