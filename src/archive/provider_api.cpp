#include "attic/archive/provider_api.hpp"

#include <nlohmann/json.hpp>

namespace attic::archive {

namespace {

// Snowflake ids arrive as strings, but accept numbers too
std::string idField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_unsigned()) {
    return std::to_string(it->get<std::uint64_t>());
  }
  return "";
}

std::string stringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>() : "";
}

}  // namespace

Result<ProviderMessage> parseProviderMessage(const std::string& body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Provider returned a malformed message body"));
  }

  ProviderMessage message;
  message.id = idField(json, "id");
  message.channel_id = idField(json, "channel_id");
  if (message.id.empty()) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Provider message has no id"));
  }

  if (auto it = json.find("attachments"); it != json.end() && it->is_array()) {
    for (const auto& item : *it) {
      if (!item.is_object()) {
        continue;
      }
      AttachmentRef ref;
      ref.id = idField(item, "id");
      ref.url = stringField(item, "url");
      ref.proxy_url = stringField(item, "proxy_url");
      ref.filename = stringField(item, "filename");
      ref.content_type = stringField(item, "content_type");
      if (auto size = item.find("size"); size != item.end() && size->is_number_unsigned()) {
        ref.size = size->get<std::uint64_t>();
      }
      message.attachments.push_back(std::move(ref));
    }
  }

  return message;
}

std::string describeProviderError(const util::HttpResponse& response) {
  std::string detail;
  auto json = nlohmann::json::parse(response.body, nullptr, false);
  if (!json.is_discarded() && json.is_object()) {
    detail = stringField(json, "message");
  }
  if (detail.empty()) {
    detail = response.body.substr(0, 200);
  }
  return "HTTP " + std::to_string(response.status_code) + (detail.empty() ? "" : ": " + detail);
}

std::vector<std::string> botHeaders(const std::string& bot_token) {
  return {
      "Authorization: Bot " + bot_token,
      "User-Agent: DiscordBot (attic, " +
          getVersion().toString() + ")",
  };
}

std::string appendQuery(const std::string& url, const std::string& param) {
  return url + (url.find('?') == std::string::npos ? "?" : "&") + param;
}

}  // namespace attic::archive
