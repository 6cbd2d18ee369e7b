#include "attic/server/api_handler.hpp"

#include <charconv>

#include <spdlog/spdlog.h>

#include "attic/archive/content_hasher.hpp"
#include "attic/util/filesystem.hpp"
#include "attic/util/multipart.hpp"

namespace attic::server {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '+') {
      out += ' ';
    } else if (text[i] == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 &&
               hexValue(text[i + 2]) >= 0) {
      out += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
      i += 2;
    } else {
      out += text[i];
    }
  }
  return out;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[percentDecode(pair)] = "";
      } else {
        params[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return params;
}

Result<std::size_t> parseCount(const std::map<std::string, std::string>& query,
                               const std::string& name, std::size_t fallback) {
  auto it = query.find(name);
  if (it == query.end() || it->second.empty()) {
    return fallback;
  }
  std::size_t value = 0;
  const auto& text = it->second;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     name + " must be a non-negative integer"));
  }
  return value;
}

ApiResponse jsonResponse(int status, const nlohmann::json& body) {
  return ApiResponse{status, "application/json", body.dump()};
}

Result<std::optional<std::string>> optionalString(const nlohmann::json& meta, const char* key) {
  auto it = meta.find(key);
  if (it == meta.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     std::string("meta.") + key + " must be a string"));
  }
  return std::optional<std::string>(it->get<std::string>());
}

Result<std::vector<std::string>> stringList(const nlohmann::json& value, const std::string& what) {
  if (!value.is_array()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, what + " must be an array"));
  }
  std::vector<std::string> items;
  for (const auto& item : value) {
    if (!item.is_string()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       what + " must contain only strings"));
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

Result<archive::ArchiveMeta> parseMeta(const std::string& text) {
  archive::ArchiveMeta meta;
  if (text.empty()) {
    return meta;
  }

  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "meta must be a JSON object"));
  }

  if (auto it = json.find("tags"); it != json.end() && !it->is_null()) {
    auto tags = stringList(*it, "meta.tags");
    if (!tags) {
      return std::unexpected(tags.error());
    }
    meta.tags = std::move(*tags);
  }

  auto tenant = optionalString(json, "tenant");
  if (!tenant) {
    return std::unexpected(tenant.error());
  }
  meta.tenant = *tenant;

  auto workspace = optionalString(json, "workspace");
  if (!workspace) {
    return std::unexpected(workspace.error());
  }
  meta.workspace = *workspace;

  auto visibility = optionalString(json, "visibility");
  if (!visibility) {
    return std::unexpected(visibility.error());
  }
  if (visibility->has_value()) {
    meta.visibility = **visibility;
  }

  if (auto it = json.find("do_not_archive"); it != json.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "meta.do_not_archive must be a boolean"));
    }
    meta.do_not_archive = it->get<bool>();
  }

  if (auto it = json.find("size_limit"); it != json.end() && !it->is_null()) {
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "meta.size_limit must be a positive integer"));
    }
    meta.size_limit = it->get<std::uint64_t>();
  }

  return meta;
}

// Constant-time comparison for the bearer token
bool constantTimeEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

}  // namespace

ApiHandler::ApiHandler(std::shared_ptr<archive::Archiver> archiver, ApiHandlerOptions options)
    : archiver_(std::move(archiver)), options_(std::move(options)) {}

int ApiHandler::statusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kPolicyDenied:
      return 422;
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kValidationError:
    case ErrorCode::kParseError:
      return 400;
    case ErrorCode::kSizeLimitUncompressible:
      return 413;
    case ErrorCode::kNotFound:
    case ErrorCode::kAttachmentNotFound:
      return 404;
    case ErrorCode::kUploadFailure:
    case ErrorCode::kNetworkError:
      return 502;
    case ErrorCode::kArchiverDisabled:
    case ErrorCode::kConfigError:
      return 503;
    default:
      return 500;
  }
}

nlohmann::json ApiHandler::errorBody(const Error& error) {
  nlohmann::json body;
  body["error"] = std::string(errorCodeToString(error.code()));
  body["message"] = error.message();
  if (!error.details().empty()) {
    body["reasons"] = error.details();
  }
  body["retryable"] = isRetryable(error.code());
  return body;
}

ApiResponse ApiHandler::errorResponse(const Error& error) {
  return jsonResponse(statusFor(error.code()), errorBody(error));
}

bool ApiHandler::authorized(const ApiRequest& request) const {
  if (options_.api_token.empty()) {
    return false;
  }
  auto it = request.headers.find("authorization");
  if (it == request.headers.end()) {
    return false;
  }
  const std::string prefix = "Bearer ";
  if (it->second.rfind(prefix, 0) != 0) {
    return false;
  }
  return constantTimeEquals(it->second.substr(prefix.size()), options_.api_token);
}

ApiResponse ApiHandler::handle(const ApiRequest& request) {
  std::string path = request.target;
  std::string query;
  if (auto q = path.find('?'); q != std::string::npos) {
    query = path.substr(q + 1);
    path.erase(q);
  }
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }

  spdlog::debug("{} {}", request.method, path);

  if (path == "/healthz") {
    if (request.method != "GET") {
      return jsonResponse(405, {{"error", "Method not allowed"}});
    }
    return handleHealth();
  }

  const std::string prefix = "/archive";
  if (path != prefix && path.rfind(prefix + "/", 0) != 0) {
    return jsonResponse(404, {{"error", "Not found"}, {"message", "No route for " + path}});
  }

  if (!authorized(request)) {
    return jsonResponse(401, {{"error", "Unauthorized"},
                              {"message", "Missing or invalid bearer token"},
                              {"retryable", false}});
  }

  if (request.body.size() > options_.max_body_bytes) {
    return jsonResponse(413, {{"error", "Payload too large"},
                              {"message", "Request body exceeds " +
                                              std::to_string(options_.max_body_bytes) + " bytes"},
                              {"retryable", false}});
  }

  if (path == prefix) {
    if (request.method != "POST") {
      return jsonResponse(405, {{"error", "Method not allowed"}});
    }
    return handleArchive(request);
  }

  std::string rest = path.substr(prefix.size() + 1);
  if (rest == "search") {
    if (request.method != "GET") {
      return jsonResponse(405, {{"error", "Method not allowed"}});
    }
    return handleSearch(parseQuery(query));
  }

  const std::string tags_suffix = "/tags";
  if (rest.size() > tags_suffix.size() &&
      rest.compare(rest.size() - tags_suffix.size(), tags_suffix.size(), tags_suffix) == 0) {
    if (request.method != "PATCH") {
      return jsonResponse(405, {{"error", "Method not allowed"}});
    }
    return handleTags(rest.substr(0, rest.size() - tags_suffix.size()), request);
  }

  if (rest.find('/') != std::string::npos) {
    return jsonResponse(404, {{"error", "Not found"}, {"message", "No route for " + path}});
  }
  if (request.method != "GET") {
    return jsonResponse(405, {{"error", "Method not allowed"}});
  }
  return handleRehydrate(rest);
}

ApiResponse ApiHandler::handleHealth() const {
  return jsonResponse(200, {{"status", "ok"}, {"enabled", archiver_->enabled()}});
}

ApiResponse ApiHandler::handleArchive(const ApiRequest& request) {
  auto content_type = request.headers.find("content-type");
  if (content_type == request.headers.end()) {
    return errorResponse(makeError(ErrorCode::kInvalidArgument, "Missing Content-Type"));
  }

  auto boundary = util::multipartBoundary(content_type->second);
  if (!boundary) {
    return errorResponse(boundary.error());
  }
  auto parts = util::parseMultipart(request.body, *boundary);
  if (!parts) {
    return errorResponse(parts.error());
  }

  const util::FormPart* file = util::findPart(*parts, "file");
  if (!file || !file->filename.has_value()) {
    return errorResponse(makeError(ErrorCode::kInvalidArgument, "Missing 'file' part"));
  }

  const util::FormPart* meta_part = util::findPart(*parts, "meta");
  auto meta = parseMeta(meta_part ? meta_part->body : "");
  if (!meta) {
    return errorResponse(meta.error());
  }

  std::string filename = util::FileSystem::sanitizeFilename(*file->filename);
  meta->filename = filename;
  meta->keep_original = false;

  auto dir = util::FileSystem::createDirectories(options_.staging_dir);
  if (!dir) {
    return errorResponse(dir.error());
  }
  std::filesystem::path staged =
      options_.staging_dir / ("upload-" + util::FileSystem::randomSuffix() + "-" + filename);
  auto written = util::FileSystem::writeFileAtomic(staged, file->body);
  if (!written) {
    return errorResponse(written.error());
  }

  auto outcome = archiver_->archiveFile(staged, *meta);
  if (!outcome) {
    auto removed = util::FileSystem::removeFile(staged);
    if (!removed) {
      spdlog::warn("Could not remove staged upload {}: {}", staged.string(),
                   removed.error().message());
    }
    spdlog::info("Archive of {} failed: {}", filename, outcome.error().message());
    return errorResponse(outcome.error());
  }

  nlohmann::json body = archive::recordToJson(outcome->record);
  body["cache_hit"] = outcome->cache_hit;
  if (outcome->quality.has_value()) {
    body["quality"] = *outcome->quality;
  }
  return jsonResponse(outcome->cache_hit ? 200 : 201, body);
}

ApiResponse ApiHandler::handleSearch(const std::map<std::string, std::string>& query) {
  auto tag = query.find("tag");
  if (tag == query.end() || tag->second.empty()) {
    return errorResponse(makeError(ErrorCode::kInvalidArgument, "Query parameter 'tag' is required"));
  }

  auto limit = parseCount(query, "limit", kDefaultSearchLimit);
  if (!limit) {
    return errorResponse(limit.error());
  }
  if (*limit == 0 || *limit > kMaxSearchLimit) {
    return errorResponse(makeError(ErrorCode::kInvalidArgument,
                                   "limit must be between 1 and " + std::to_string(kMaxSearchLimit)));
  }
  auto offset = parseCount(query, "offset", 0);
  if (!offset) {
    return errorResponse(offset.error());
  }

  auto results = archiver_->searchTag(tag->second, *limit, *offset);
  if (!results) {
    return errorResponse(results.error());
  }

  nlohmann::json items = nlohmann::json::array();
  for (const auto& summary : *results) {
    items.push_back(archive::summaryToJson(summary));
  }
  return jsonResponse(200, {{"results", items}, {"limit", *limit}, {"offset", *offset}});
}

ApiResponse ApiHandler::handleRehydrate(const std::string& content_hash) {
  // A string that cannot be a digest is just another unknown hash
  if (!archive::ContentHasher::isValidHash(content_hash)) {
    return errorResponse(makeError(ErrorCode::kNotFound, "No archive record for " + content_hash));
  }

  auto link = archiver_->rehydrate(content_hash);
  if (!link) {
    return errorResponse(link.error());
  }
  return jsonResponse(200, {{"content_hash", link->content_hash},
                            {"url", link->url},
                            {"filename", link->filename}});
}

ApiResponse ApiHandler::handleTags(const std::string& content_hash, const ApiRequest& request) {
  if (!archive::ContentHasher::isValidHash(content_hash)) {
    return errorResponse(makeError(ErrorCode::kNotFound, "No archive record for " + content_hash));
  }

  auto json = nlohmann::json::parse(request.body, nullptr, false);
  if (json.is_discarded() || !json.is_object() || !json.contains("tags")) {
    return errorResponse(makeError(ErrorCode::kInvalidArgument,
                                   "Body must be a JSON object with a 'tags' array"));
  }
  auto tags = stringList(json["tags"], "tags");
  if (!tags) {
    return errorResponse(tags.error());
  }

  auto record = archiver_->updateTags(content_hash, *tags);
  if (!record) {
    return errorResponse(record.error());
  }
  return jsonResponse(200, archive::recordToJson(*record));
}

}  // namespace attic::server
