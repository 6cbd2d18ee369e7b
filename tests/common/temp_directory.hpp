#pragma once

#include <filesystem>
#include <string>

namespace attic::test {

// RAII temporary directory for testing
class TempDirectory {
 public:
  TempDirectory();
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path createSubdir(const std::string& name);

  // Binary-safe; parent directories are created as needed
  std::filesystem::path createFile(const std::string& name, const std::string& content = "");

  // File of `size` bytes filled with a repeating pattern
  std::filesystem::path createSizedFile(const std::string& name, std::size_t size, char seed = 'a');

  void cleanup();

 private:
  std::filesystem::path path_;
};

}  // namespace attic::test
