#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "attic/archive/types.hpp"
#include "attic/common.hpp"

namespace attic::archive {

struct RecordResult {
  ArchiveRecord record;  // The stored row, which is the earlier one if `inserted` is false
  bool inserted = false;
};

/**
 * @brief Durable content_hash -> ArchiveRecord index
 *
 * Rows are written once. The only sanctioned mutation is updateTags().
 * Implementations must be safe to share across threads.
 */
class Manifest {
 public:
  virtual ~Manifest() = default;

  // Create storage and schema if needed
  virtual Result<void> initialize() = 0;

  virtual Result<std::optional<ArchiveRecord>> lookup(const std::string& content_hash) = 0;

  // Atomic insert-if-absent keyed on content_hash
  virtual Result<RecordResult> record(const ArchiveRecord& record) = 0;

  // Replace the tag set of an existing row; kNotFound when the hash is unknown
  virtual Result<ArchiveRecord> updateTags(const std::string& content_hash,
                                           const std::vector<std::string>& tags) = 0;

  // Substring match over stored tags, newest first
  virtual Result<std::vector<ManifestSummary>> searchTag(const std::string& substring,
                                                         std::size_t limit,
                                                         std::size_t offset) = 0;

  virtual Result<ManifestStats> stats() = 0;
};

}  // namespace attic::archive
