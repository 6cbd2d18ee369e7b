#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "attic/archive/channel_router.hpp"
#include "attic/archive/cleanup_manager.hpp"
#include "attic/archive/compressor.hpp"
#include "attic/archive/manifest.hpp"
#include "attic/archive/policy_engine.hpp"
#include "attic/archive/rehydrator.hpp"
#include "attic/archive/size_limit_detector.hpp"
#include "attic/archive/types.hpp"
#include "attic/archive/uploader.hpp"
#include "attic/common.hpp"

namespace attic::archive {

struct ArchiverOptions {
  bool enabled = false;
  bool allow_fallback = false;
  std::string bot_token;
  std::string default_webhook;
};

struct ArchiveOutcome {
  ArchiveRecord record;
  bool cache_hit = false;
  std::optional<int> quality;  // JPEG quality when the file was re-encoded
};

struct RehydratedLink {
  std::string content_hash;
  std::string url;
  std::string filename;
};

// Collaborators, all required
struct ArchiverServices {
  std::shared_ptr<PolicyEngine> policy;
  std::shared_ptr<ChannelRouter> router;
  std::shared_ptr<SizeLimitDetector> limits;
  std::shared_ptr<Compressor> compressor;
  std::shared_ptr<Manifest> manifest;
  std::shared_ptr<Uploader> uploader;
  std::shared_ptr<Rehydrator> rehydrator;
  std::shared_ptr<CleanupManager> cleanup;
};

/**
 * @brief Sequences policy, routing, compression, dedup and upload
 *
 * archiveFile() runs once, without retries, and stops at the first
 * failure. The manifest is consulted only after hashing the final
 * artifact and before any upload. A failed upload never reaches the
 * manifest.
 */
class Archiver {
 public:
  Archiver(ArchiverOptions options, ArchiverServices services);

  Result<ArchiveOutcome> archiveFile(const std::filesystem::path& path, const ArchiveMeta& meta);

  Result<RehydratedLink> rehydrate(const std::string& content_hash);

  Result<std::optional<ArchiveRecord>> lookup(const std::string& content_hash);
  Result<std::vector<ManifestSummary>> searchTag(const std::string& substring, std::size_t limit,
                                                 std::size_t offset);
  Result<ArchiveRecord> updateTags(const std::string& content_hash,
                                   const std::vector<std::string>& tags);
  Result<ManifestStats> stats();

  bool enabled() const { return options_.enabled; }

 private:
  struct UploadMode {
    bool use_bot = true;
    Credentials credentials;
  };

  // Bot when a token exists; webhook only when allowed and known
  std::optional<UploadMode> resolveUploadMode(const RouteDecision& route) const;

  // Credentials that can read the record's message back, plus the thread
  // id a webhook read needs
  std::pair<Credentials, std::optional<std::string>> rehydrationCredentials(
      const ArchiveRecord& record) const;

  void cleanupLocal(const std::filesystem::path& original,
                    const CompressionResult& compression, bool keep_original) const;

  ArchiverOptions options_;
  ArchiverServices services_;
};

}  // namespace attic::archive
