#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "attic/common.hpp"
#include "attic/util/http_client.hpp"

namespace attic::archive {

// Attachment as reported by the provider's message API
struct AttachmentRef {
  std::string id;
  std::string url;
  std::string proxy_url;
  std::string filename;
  std::uint64_t size = 0;
  std::string content_type;
};

// Message object as returned by create/get message calls
struct ProviderMessage {
  std::string id;
  std::string channel_id;
  std::vector<AttachmentRef> attachments;
};

// Parse a message object; malformed bodies are kUploadFailure
Result<ProviderMessage> parseProviderMessage(const std::string& body);

// "<status>: <provider message or trimmed body>"
std::string describeProviderError(const util::HttpResponse& response);

// Authorization and User-Agent headers for bot-authenticated calls
std::vector<std::string> botHeaders(const std::string& bot_token);

// Append a query parameter, choosing '?' or '&'
std::string appendQuery(const std::string& url, const std::string& param);

}  // namespace attic::archive
