#include "attic/archive/image_codec.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <jpeglib.h>
#include <png.h>

#include "attic/archive/types.hpp"

namespace attic::archive {

namespace {

constexpr std::uint64_t kMaxPixels = 200ULL * 1000 * 1000;

struct JpegErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

// Closes a stdio handle on scope exit
struct FileCloser {
  std::FILE* file;
  ~FileCloser() {
    if (file) {
      std::fclose(file);
    }
  }
};

bool readJpeg(std::FILE* file, RasterImage* out, std::string* message) {
  jpeg_decompress_struct cinfo;
  JpegErrorManager jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpegErrorExit;

  if (setjmp(jerr.jump)) {
    *message = jerr.message;
    jpeg_destroy_decompress(&cinfo);
    return false;
  }

  jpeg_create_decompress(&cinfo);
  jpeg_stdio_src(&cinfo, file);
  jpeg_read_header(&cinfo, TRUE);
  cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&cinfo);

  if (cinfo.output_components != 3 ||
      static_cast<std::uint64_t>(cinfo.output_width) * cinfo.output_height > kMaxPixels) {
    *message = "unsupported JPEG layout";
    jpeg_destroy_decompress(&cinfo);
    return false;
  }

  out->width = static_cast<int>(cinfo.output_width);
  out->height = static_cast<int>(cinfo.output_height);
  out->pixels.resize(static_cast<std::size_t>(out->width) * out->height * 3);

  const std::size_t stride = static_cast<std::size_t>(out->width) * 3;
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW row = out->pixels.data() + cinfo.output_scanline * stride;
    jpeg_read_scanlines(&cinfo, &row, 1);
  }

  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return true;
}

bool writeJpeg(const RasterImage& image, int quality, unsigned char** buffer,
               unsigned long* size, std::string* message) {
  jpeg_compress_struct cinfo;
  JpegErrorManager jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpegErrorExit;

  if (setjmp(jerr.jump)) {
    *message = jerr.message;
    jpeg_destroy_compress(&cinfo);
    return false;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, buffer, size);

  cinfo.image_width = static_cast<JDIMENSION>(image.width);
  cinfo.image_height = static_cast<JDIMENSION>(image.height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  const std::size_t stride = static_cast<std::size_t>(image.width) * 3;
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW row = const_cast<JSAMPLE*>(image.pixels.data() + cinfo.next_scanline * stride);
    jpeg_write_scanlines(&cinfo, &row, 1);
  }

  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);
  return true;
}

}  // namespace

bool JpegImageCodec::supports(const std::filesystem::path& path) const {
  std::string ext = normalizeExtension(path);
  return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

Result<RasterImage> JpegImageCodec::decode(const std::filesystem::path& path) {
  std::string ext = normalizeExtension(path);
  if (ext == ".png") {
    return decodePng(path);
  }
  if (ext == ".jpg" || ext == ".jpeg") {
    return decodeJpeg(path);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "No decoder for " + path.filename().string()));
}

Result<RasterImage> JpegImageCodec::decodePng(const std::filesystem::path& path) {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;

  if (!png_image_begin_read_from_file(&image, path.c_str())) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "PNG decode failed: " + std::string(image.message)));
  }

  if (static_cast<std::uint64_t>(image.width) * image.height > kMaxPixels) {
    png_image_free(&image);
    return std::unexpected(makeError(ErrorCode::kParseError, "PNG dimensions too large"));
  }

  // Requesting RGB makes libpng composite any alpha over the background
  image.format = PNG_FORMAT_RGB;
  png_color background{255, 255, 255};

  RasterImage raster;
  raster.width = static_cast<int>(image.width);
  raster.height = static_cast<int>(image.height);
  raster.pixels.resize(PNG_IMAGE_SIZE(image));

  if (!png_image_finish_read(&image, &background, raster.pixels.data(), 0, nullptr)) {
    std::string message = image.message;
    png_image_free(&image);
    return std::unexpected(makeError(ErrorCode::kParseError, "PNG decode failed: " + message));
  }

  return raster;
}

Result<RasterImage> JpegImageCodec::decodeJpeg(const std::filesystem::path& path) {
  FileCloser closer{std::fopen(path.c_str(), "rb")};
  if (!closer.file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open image: " + path.string()));
  }

  RasterImage raster;
  std::string message;
  if (!readJpeg(closer.file, &raster, &message)) {
    return std::unexpected(makeError(ErrorCode::kParseError, "JPEG decode failed: " + message));
  }
  return raster;
}

Result<std::string> JpegImageCodec::encodeJpeg(const RasterImage& image, int quality) {
  if (image.width <= 0 || image.height <= 0 ||
      image.pixels.size() != static_cast<std::size_t>(image.width) * image.height * 3) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Malformed raster image"));
  }

  unsigned char* buffer = nullptr;
  unsigned long size = 0;
  std::string message;

  bool ok = writeJpeg(image, quality, &buffer, &size, &message);
  std::string encoded;
  if (ok && buffer) {
    encoded.assign(reinterpret_cast<const char*>(buffer), size);
  }
  std::free(buffer);

  if (!ok) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "JPEG encode failed: " + message));
  }
  return encoded;
}

}  // namespace attic::archive
