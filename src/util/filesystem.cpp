#include "attic/util/filesystem.hpp"

#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace attic::util {

namespace {

// Removes the temp file unless the rename went through
class StagedTempFile {
 public:
  explicit StagedTempFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~StagedTempFile() {
    if (!released_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }

  StagedTempFile(const StagedTempFile&) = delete;
  StagedTempFile& operator=(const StagedTempFile&) = delete;

  const std::filesystem::path& path() const { return path_; }
  void release() { released_ = true; }

 private:
  std::filesystem::path path_;
  bool released_ = false;
};

void syncPath(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    ::fsync(fd);
    ::close(fd);
  }
}

}  // namespace

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create " + parent.string() + ": " + ec.message()));
    }
  }

  std::filesystem::path temp_path = path;
  temp_path += ".part-" + randomSuffix(6);
  StagedTempFile temp(temp_path);

  {
    std::ofstream out(temp.path(), std::ios::binary);
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create " + temp.path().string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Short write to " + temp.path().string()));
    }
  }
  syncPath(temp.path());

  std::error_code ec;
  std::filesystem::rename(temp.path(), path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot move " + path.filename().string() +
                                         " into place: " + ec.message()));
  }
  temp.release();

  if (!parent.empty()) {
    syncPath(parent);
  }
  return {};
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

Result<std::uintmax_t> FileSystem::fileSize(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + ec.message()));
  }

  return size;
}

Result<void> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  // remove() reports "did not exist" through its return value, not ec
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot remove file: " + ec.message()));
  }

  return {};
}

std::string FileSystem::randomSuffix(std::size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

std::string FileSystem::sanitizeFilename(const std::string& name) {
  std::string base = std::filesystem::path(name).filename().string();

  std::string result;
  result.reserve(base.size());
  for (char c : base) {
    if (c == '/' || c == '\\' || c == '\0' || static_cast<unsigned char>(c) < 0x20) {
      result += '_';
    } else {
      result += c;
    }
  }

  if (result.empty() || result == "." || result == "..") {
    return "upload.bin";
  }
  return result;
}

}  // namespace attic::util
