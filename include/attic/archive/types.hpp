#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace attic::archive {

// Coarse media classification used for routing and compression
enum class MediaKind {
  kImages,
  kVideos,
  kAudio,
  kDocs,
  kBlobs
};

std::string_view mediaKindToString(MediaKind kind);
std::optional<MediaKind> mediaKindFromString(std::string_view name);

// Extensions (lower-case, with leading dot) per kind. kBlobs has no list.
using KindExtensions = std::map<MediaKind, std::vector<std::string>>;

KindExtensions defaultKindExtensions();
std::vector<std::string> defaultDeniedExtensions();

// Lower-cased extension with its leading dot, empty when the path has none
std::string normalizeExtension(const std::filesystem::path& path);

// Trim, lower-case, drop commas and empties, de-duplicate; keeps first-seen order
std::vector<std::string> normalizeTags(const std::vector<std::string>& tags);

// Caller-supplied metadata for one archive request
struct ArchiveMeta {
  std::vector<std::string> tags;
  std::optional<std::string> tenant;
  std::optional<std::string> workspace;
  std::string visibility = "public";
  bool do_not_archive = false;
  std::optional<std::uint64_t> size_limit;  // Policy ceiling; settings maximum when empty
  bool keep_original = false;                // Leave the source file in place on success
  std::optional<std::string> filename;       // Reported name; defaults to the path's filename
};

struct PolicyDecision {
  bool allowed = true;
  std::vector<std::string> reasons;
};

struct RouteDecision {
  std::string channel_id;
  std::optional<std::string> thread_id;
  std::optional<std::string> webhook_url;  // Fallback delivery endpoint for this destination
};

struct CompressionStats {
  std::uint64_t original_size = 0;
  std::uint64_t final_size = 0;
};

// Upload and read credentials for the storage provider
struct Credentials {
  std::string bot_token;
  std::string webhook_url;

  bool hasBot() const { return !bot_token.empty(); }
  bool hasWebhook() const { return !webhook_url.empty(); }
};

struct Attachment {
  std::string id;
  std::string url;
  std::string filename;
  std::uint64_t size = 0;
};

struct UploadReceipt {
  std::string message_id;
  std::string channel_id;
  std::vector<Attachment> attachments;
};

// Durable manifest row, keyed by content_hash
struct ArchiveRecord {
  std::string content_hash;
  std::string message_id;
  std::string channel_id;
  std::vector<std::string> attachment_ids;
  std::string filename;
  std::uint64_t size = 0;
  std::string sha256;
  std::optional<std::string> tenant;
  std::optional<std::string> workspace;
  std::string media_type;
  std::string visibility;
  std::vector<std::string> tags;
  CompressionStats compression;
  std::chrono::system_clock::time_point created_at;
};

// Partial record returned by tag search
struct ManifestSummary {
  std::string content_hash;
  std::string filename;
  std::string media_type;
  std::string visibility;
  std::vector<std::string> tags;
  std::uint64_t size = 0;
  std::chrono::system_clock::time_point created_at;
};

struct ManifestStats {
  std::uint64_t records = 0;
  std::uint64_t total_bytes = 0;
  std::map<std::string, std::uint64_t> by_media_type;
};

nlohmann::json compressionToJson(const CompressionStats& stats);
CompressionStats compressionFromJson(const nlohmann::json& json);

nlohmann::json recordToJson(const ArchiveRecord& record);
nlohmann::json summaryToJson(const ManifestSummary& summary);
nlohmann::json statsToJson(const ManifestStats& stats);

}  // namespace attic::archive
