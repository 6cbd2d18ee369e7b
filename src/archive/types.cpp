#include "attic/archive/types.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "attic/util/time.hpp"

namespace attic::archive {

std::string_view mediaKindToString(MediaKind kind) {
  switch (kind) {
    case MediaKind::kImages:
      return "images";
    case MediaKind::kVideos:
      return "videos";
    case MediaKind::kAudio:
      return "audio";
    case MediaKind::kDocs:
      return "docs";
    case MediaKind::kBlobs:
      return "blobs";
  }
  return "blobs";
}

std::optional<MediaKind> mediaKindFromString(std::string_view name) {
  if (name == "images") return MediaKind::kImages;
  if (name == "videos") return MediaKind::kVideos;
  if (name == "audio") return MediaKind::kAudio;
  if (name == "docs") return MediaKind::kDocs;
  if (name == "blobs") return MediaKind::kBlobs;
  return std::nullopt;
}

KindExtensions defaultKindExtensions() {
  return {
      {MediaKind::kImages, {".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp", ".tiff"}},
      {MediaKind::kVideos, {".mp4", ".mov", ".webm", ".mkv", ".avi"}},
      {MediaKind::kAudio, {".mp3", ".wav", ".ogg", ".flac", ".m4a", ".aac"}},
      {MediaKind::kDocs, {".pdf", ".txt", ".md", ".doc", ".docx", ".csv", ".json"}},
  };
}

std::vector<std::string> defaultDeniedExtensions() {
  return {".exe", ".bat", ".cmd", ".sh", ".ps1", ".msi",
          ".com", ".scr", ".js", ".vbs", ".jar", ".dll"};
}

std::string normalizeExtension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::vector<std::string> normalizeTags(const std::vector<std::string>& tags) {
  std::vector<std::string> result;
  std::unordered_set<std::string> seen;

  for (const auto& raw : tags) {
    std::string tag;
    tag.reserve(raw.size());
    for (char c : raw) {
      if (c != ',') {
        tag.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
    }

    auto begin = tag.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
      continue;
    }
    auto end = tag.find_last_not_of(" \t\r\n");
    tag = tag.substr(begin, end - begin + 1);

    if (seen.insert(tag).second) {
      result.push_back(std::move(tag));
    }
  }

  return result;
}

nlohmann::json compressionToJson(const CompressionStats& stats) {
  return {
      {"original_size", stats.original_size},
      {"final_size", stats.final_size},
  };
}

CompressionStats compressionFromJson(const nlohmann::json& json) {
  CompressionStats stats;
  if (!json.is_object()) {
    return stats;
  }
  if (auto it = json.find("original_size"); it != json.end() && it->is_number_unsigned()) {
    stats.original_size = it->get<std::uint64_t>();
  }
  if (auto it = json.find("final_size"); it != json.end() && it->is_number_unsigned()) {
    stats.final_size = it->get<std::uint64_t>();
  }
  return stats;
}

nlohmann::json recordToJson(const ArchiveRecord& record) {
  nlohmann::json json;
  json["content_hash"] = record.content_hash;
  json["message_id"] = record.message_id;
  json["channel_id"] = record.channel_id;
  json["attachment_ids"] = record.attachment_ids;
  json["filename"] = record.filename;
  json["size"] = record.size;
  json["sha256"] = record.sha256;
  json["tenant"] = record.tenant ? nlohmann::json(*record.tenant) : nlohmann::json(nullptr);
  json["workspace"] = record.workspace ? nlohmann::json(*record.workspace) : nlohmann::json(nullptr);
  json["media_type"] = record.media_type;
  json["visibility"] = record.visibility;
  json["tags"] = record.tags;
  json["compression"] = compressionToJson(record.compression);
  json["created_at"] = util::Time::toRfc3339(record.created_at);
  return json;
}

nlohmann::json summaryToJson(const ManifestSummary& summary) {
  return {
      {"content_hash", summary.content_hash},
      {"filename", summary.filename},
      {"media_type", summary.media_type},
      {"visibility", summary.visibility},
      {"tags", summary.tags},
      {"size", summary.size},
      {"created_at", util::Time::toRfc3339(summary.created_at)},
  };
}

nlohmann::json statsToJson(const ManifestStats& stats) {
  nlohmann::json by_type = nlohmann::json::object();
  for (const auto& [media_type, count] : stats.by_media_type) {
    by_type[media_type] = count;
  }
  return {
      {"records", stats.records},
      {"total_bytes", stats.total_bytes},
      {"by_media_type", by_type},
  };
}

}  // namespace attic::archive
