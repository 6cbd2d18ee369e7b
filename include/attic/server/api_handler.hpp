#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "attic/archive/archiver.hpp"
#include "attic/common.hpp"

namespace attic::server {

struct ApiRequest {
  std::string method;                          // Upper-case verb
  std::string target;                          // Path plus optional query string
  std::map<std::string, std::string> headers;  // Lower-case names
  std::string body;
};

struct ApiResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

struct ApiHandlerOptions {
  std::string api_token;
  std::filesystem::path staging_dir;
  std::uint64_t max_body_bytes = 64ULL * 1024 * 1024;
};

/**
 * @brief Routes façade requests onto the Archiver
 *
 *   GET   /healthz
 *   POST  /archive                    multipart: file, meta (JSON)
 *   GET   /archive/search?tag=&limit=&offset=
 *   GET   /archive/{hash}
 *   PATCH /archive/{hash}/tags        {"tags": [...]}
 *
 * Every /archive route requires `Authorization: Bearer <api_token>`.
 */
class ApiHandler {
 public:
  static constexpr std::size_t kDefaultSearchLimit = 50;
  static constexpr std::size_t kMaxSearchLimit = 500;

  ApiHandler(std::shared_ptr<archive::Archiver> archiver, ApiHandlerOptions options);

  ApiResponse handle(const ApiRequest& request);

  static int statusFor(ErrorCode code);
  static nlohmann::json errorBody(const Error& error);
  static ApiResponse errorResponse(const Error& error);

 private:
  bool authorized(const ApiRequest& request) const;

  ApiResponse handleHealth() const;
  ApiResponse handleArchive(const ApiRequest& request);
  ApiResponse handleSearch(const std::map<std::string, std::string>& query);
  ApiResponse handleRehydrate(const std::string& content_hash);
  ApiResponse handleTags(const std::string& content_hash, const ApiRequest& request);

  std::shared_ptr<archive::Archiver> archiver_;
  ApiHandlerOptions options_;
};

}  // namespace attic::server
