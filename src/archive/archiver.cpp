#include "attic/archive/archiver.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "attic/archive/content_hasher.hpp"
#include "attic/util/time.hpp"

namespace attic::archive {

Archiver::Archiver(ArchiverOptions options, ArchiverServices services)
    : options_(std::move(options)), services_(std::move(services)) {
  if (!services_.policy || !services_.router || !services_.limits || !services_.compressor ||
      !services_.manifest || !services_.uploader || !services_.rehydrator || !services_.cleanup) {
    throw std::invalid_argument("Archiver requires every collaborator");
  }
}

std::optional<Archiver::UploadMode> Archiver::resolveUploadMode(const RouteDecision& route) const {
  if (!options_.bot_token.empty()) {
    return UploadMode{true, Credentials{options_.bot_token, ""}};
  }
  if (options_.allow_fallback) {
    std::string webhook = route.webhook_url.value_or(options_.default_webhook);
    if (!webhook.empty()) {
      return UploadMode{false, Credentials{"", webhook}};
    }
  }
  return std::nullopt;
}

std::pair<Credentials, std::optional<std::string>> Archiver::rehydrationCredentials(
    const ArchiveRecord& record) const {
  if (!options_.bot_token.empty()) {
    return {Credentials{options_.bot_token, ""}, std::nullopt};
  }
  if (!options_.allow_fallback) {
    return {Credentials{}, std::nullopt};
  }

  // Re-derive the destination the record was delivered to
  std::optional<RouteDecision> route;
  if (auto kind = mediaKindFromString(record.media_type)) {
    auto routed = services_.router->routeFor(*kind, record.tenant, record.visibility);
    if (routed) {
      route = std::move(*routed);
    } else {
      spdlog::warn("No route for stored record {}: {}", record.content_hash,
                   routed.error().message());
    }
  }

  std::string webhook = options_.default_webhook;
  std::optional<std::string> thread_id;
  if (route.has_value()) {
    if (route->webhook_url.has_value()) {
      webhook = *route->webhook_url;
    }
    if (route->thread_id.has_value()) {
      // Receipts report the thread as the channel
      thread_id = record.channel_id;
    }
  }
  return {Credentials{"", webhook}, thread_id};
}

void Archiver::cleanupLocal(const std::filesystem::path& original,
                            const CompressionResult& compression, bool keep_original) const {
  std::vector<std::filesystem::path> paths;
  if (!keep_original) {
    paths.push_back(original);
  }
  if (compression.reencoded()) {
    paths.push_back(compression.output_path);
  }
  services_.cleanup->removeAll(paths);
}

Result<ArchiveOutcome> Archiver::archiveFile(const std::filesystem::path& path,
                                             const ArchiveMeta& meta) {
  if (!options_.enabled) {
    return std::unexpected(makeError(ErrorCode::kArchiverDisabled, "Archiver is disabled"));
  }

  auto decision = services_.policy->check(path, meta);
  if (!decision.allowed) {
    return std::unexpected(Error(ErrorCode::kPolicyDenied,
                                 "Policy denied " + path.filename().string(),
                                 std::move(decision.reasons)));
  }

  auto route = services_.router->pickChannel(path, meta);
  if (!route) {
    return std::unexpected(route.error());
  }

  // The limit depends on the delivery mode; without credentials assume bot and fail at upload
  auto mode = resolveUploadMode(*route);
  bool use_bot = mode.has_value() ? mode->use_bot : true;
  std::uint64_t limit = services_.limits->detect(route->channel_id, use_bot);
  MediaKind kind = services_.router->kindFromPath(path);
  spdlog::debug("Archiving {} as {} under {} byte limit", path.filename().string(),
                mediaKindToString(kind), limit);

  auto compression = services_.compressor->fitToLimit(path, limit, kind);
  if (!compression) {
    return std::unexpected(compression.error());
  }

  auto fail = [&](Error error) -> Result<ArchiveOutcome> {
    if (compression->reencoded()) {
      auto removed = services_.cleanup->remove(compression->output_path);
      if (!removed) {
        spdlog::warn("Could not remove intermediate {}: {}", compression->output_path.string(),
                     removed.error().message());
      }
    }
    return std::unexpected(std::move(error));
  };

  auto hash = ContentHasher::computeHash(compression->output_path);
  if (!hash) {
    return fail(hash.error());
  }

  auto existing = services_.manifest->lookup(*hash);
  if (!existing) {
    return fail(existing.error());
  }
  if (existing->has_value()) {
    spdlog::info("Cache hit for {} ({})", path.filename().string(), *hash);
    cleanupLocal(path, *compression, meta.keep_original);
    return ArchiveOutcome{std::move(**existing), true, compression->quality};
  }

  if (!mode.has_value()) {
    return fail(makeError(ErrorCode::kConfigError,
                          "No upload credentials configured (bot token, or an allowed webhook)"));
  }

  std::string filename = meta.filename.value_or(path.filename().string());
  if (compression->reencoded()) {
    filename = std::filesystem::path(filename).stem().string() + ".jpg";
  }

  auto receipt = services_.uploader->upload(UploadRequest{compression->output_path, filename},
                                            *route, mode->credentials, !mode->use_bot);
  if (!receipt) {
    return fail(receipt.error());
  }

  ArchiveRecord record;
  record.content_hash = *hash;
  record.message_id = receipt->message_id;
  record.channel_id = receipt->channel_id;
  for (const auto& attachment : receipt->attachments) {
    record.attachment_ids.push_back(attachment.id);
  }
  record.filename = filename;
  record.size = compression->stats.final_size;
  record.sha256 = *hash;
  record.tenant = meta.tenant;
  record.workspace = meta.workspace;
  record.media_type = std::string(mediaKindToString(kind));
  record.visibility = meta.visibility;
  record.tags = normalizeTags(meta.tags);
  record.compression = compression->stats;
  record.created_at = util::Time::now();

  auto stored = services_.manifest->record(record);
  if (!stored) {
    spdlog::error("Uploaded {} as message {} but could not record it: {}", *hash,
                  receipt->message_id, stored.error().message());
    return fail(stored.error());
  }
  if (!stored->inserted) {
    spdlog::warn("Concurrent archive of {}: message {} duplicates the recorded one", *hash,
                 receipt->message_id);
  }

  cleanupLocal(path, *compression, meta.keep_original);
  return ArchiveOutcome{std::move(stored->record), false, compression->quality};
}

Result<RehydratedLink> Archiver::rehydrate(const std::string& content_hash) {
  auto existing = services_.manifest->lookup(content_hash);
  if (!existing) {
    return std::unexpected(existing.error());
  }
  if (!existing->has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "No archive record for " + content_hash));
  }
  const ArchiveRecord& record = **existing;

  auto [credentials, thread_id] = rehydrationCredentials(record);
  std::optional<std::string> attachment_id;
  if (!record.attachment_ids.empty()) {
    attachment_id = record.attachment_ids.front();
  }

  auto ref = services_.rehydrator->fetchAttachment(record.message_id, record.channel_id,
                                                   credentials, attachment_id, thread_id);
  if (!ref) {
    return std::unexpected(ref.error());
  }
  return RehydratedLink{record.content_hash, ref->url, record.filename};
}

Result<std::optional<ArchiveRecord>> Archiver::lookup(const std::string& content_hash) {
  return services_.manifest->lookup(content_hash);
}

Result<std::vector<ManifestSummary>> Archiver::searchTag(const std::string& substring,
                                                         std::size_t limit, std::size_t offset) {
  return services_.manifest->searchTag(substring, limit, offset);
}

Result<ArchiveRecord> Archiver::updateTags(const std::string& content_hash,
                                           const std::vector<std::string>& tags) {
  return services_.manifest->updateTags(content_hash, tags);
}

Result<ManifestStats> Archiver::stats() {
  return services_.manifest->stats();
}

}  // namespace attic::archive
