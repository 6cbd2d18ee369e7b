#include "attic/archive/rehydrator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace attic::archive {

Rehydrator::Rehydrator(std::string api_base, TransportFactory transport_factory)
    : api_base_(std::move(api_base)), transport_factory_(std::move(transport_factory)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

Result<AttachmentRef> Rehydrator::fetchAttachment(const std::string& message_id,
                                                  const std::string& channel_id,
                                                  const Credentials& credentials,
                                                  const std::optional<std::string>& attachment_id,
                                                  const std::optional<std::string>& webhook_thread_id) {
  std::string url;
  std::vector<std::string> headers;
  if (credentials.hasBot()) {
    url = api_base_ + "/channels/" + channel_id + "/messages/" + message_id;
    headers = botHeaders(credentials.bot_token);
  } else if (credentials.hasWebhook()) {
    std::string webhook = credentials.webhook_url;
    auto query = webhook.find('?');
    if (query != std::string::npos) {
      webhook.erase(query);
    }
    url = webhook + "/messages/" + message_id;
    if (webhook_thread_id.has_value() && !webhook_thread_id->empty()) {
      url = appendQuery(url, "thread_id=" + *webhook_thread_id);
    }
  } else {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "No credentials configured for rehydration"));
  }

  auto transport = transport_factory_();
  if (!transport) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure, "No HTTP transport available"));
  }

  auto response = transport->get(url, headers);
  if (!response) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Fetching message " + message_id + " failed: " +
                                         response.error().message()));
  }
  if (response->status_code == 404) {
    return std::unexpected(makeError(ErrorCode::kAttachmentNotFound,
                                     "Message " + message_id + " no longer exists in " + channel_id));
  }
  if (!response->ok()) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Provider rejected message fetch: " +
                                         describeProviderError(*response)));
  }

  auto message = parseProviderMessage(response->body);
  if (!message) {
    return std::unexpected(message.error());
  }

  const auto& attachments = message->attachments;
  if (attachment_id.has_value()) {
    auto it = std::find_if(attachments.begin(), attachments.end(),
                           [&](const AttachmentRef& ref) { return ref.id == *attachment_id; });
    if (it == attachments.end()) {
      return std::unexpected(makeError(ErrorCode::kAttachmentNotFound,
                                       "Attachment " + *attachment_id + " not found on message " +
                                           message_id));
    }
    spdlog::info("Rehydrated attachment {} of message {}", it->id, message_id);
    return *it;
  }

  if (attachments.empty()) {
    return std::unexpected(makeError(ErrorCode::kAttachmentNotFound,
                                     "Message " + message_id + " has no attachments"));
  }
  spdlog::info("Rehydrated first attachment of message {}", message_id);
  return attachments.front();
}

}  // namespace attic::archive
