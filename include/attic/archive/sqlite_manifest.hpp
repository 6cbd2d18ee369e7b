#pragma once

#include <filesystem>

#include "attic/archive/manifest.hpp"

namespace attic::archive {

/**
 * @brief SQLite-backed manifest
 *
 * Every call opens its own connection (WAL, 5 s busy timeout) and lets
 * SQLite's locking serialise conflicting writers. No connection is
 * shared between threads.
 */
class SqliteManifest : public Manifest {
 public:
  static constexpr int kBusyTimeoutMs = 5000;

  explicit SqliteManifest(std::filesystem::path db_path);

  Result<void> initialize() override;
  Result<std::optional<ArchiveRecord>> lookup(const std::string& content_hash) override;
  Result<RecordResult> record(const ArchiveRecord& record) override;
  Result<ArchiveRecord> updateTags(const std::string& content_hash,
                                   const std::vector<std::string>& tags) override;
  Result<std::vector<ManifestSummary>> searchTag(const std::string& substring,
                                                 std::size_t limit,
                                                 std::size_t offset) override;
  Result<ManifestStats> stats() override;

  const std::filesystem::path& path() const { return db_path_; }

 private:
  std::filesystem::path db_path_;
};

}  // namespace attic::archive
