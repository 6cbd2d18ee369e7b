#include "attic/archive/uploader.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "attic/archive/provider_api.hpp"

namespace attic::archive {

std::future<Result<UploadReceipt>> Uploader::uploadAsync(UploadRequest request,
                                                         RouteDecision destination,
                                                         Credentials credentials,
                                                         bool use_fallback) {
  return std::async(std::launch::async,
                    [this, request = std::move(request), destination = std::move(destination),
                     credentials = std::move(credentials), use_fallback]() {
                      return upload(request, destination, credentials, use_fallback);
                    });
}

ChatUploader::ChatUploader(std::string api_base, TransportFactory transport_factory)
    : api_base_(std::move(api_base)), transport_factory_(std::move(transport_factory)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

Result<UploadReceipt> ChatUploader::upload(const UploadRequest& request,
                                           const RouteDecision& destination,
                                           const Credentials& credentials,
                                           bool use_fallback) {
  if (use_fallback) {
    std::string webhook = destination.webhook_url.value_or(credentials.webhook_url);
    if (webhook.empty()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Fallback upload requested but no webhook is configured"));
    }
    std::string url = appendQuery(webhook, "wait=true");
    if (destination.thread_id.has_value()) {
      url = appendQuery(url, "thread_id=" + *destination.thread_id);
    }
    spdlog::debug("Uploading {} via webhook", request.filename);
    return send(url, {}, request, destination);
  }

  if (!credentials.hasBot()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "No bot token configured"));
  }

  const std::string& target = destination.thread_id.value_or(destination.channel_id);
  std::string url = api_base_ + "/channels/" + target + "/messages";
  spdlog::debug("Uploading {} to channel {}", request.filename, target);
  return send(url, botHeaders(credentials.bot_token), request, destination);
}

Result<UploadReceipt> ChatUploader::send(const std::string& url,
                                         const std::vector<std::string>& headers,
                                         const UploadRequest& request,
                                         const RouteDecision& destination) {
  auto transport = transport_factory_();
  if (!transport) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure, "No HTTP transport available"));
  }

  nlohmann::json payload;
  payload["content"] = "";
  payload["attachments"] = nlohmann::json::array({{{"id", 0}, {"filename", request.filename}}});

  std::vector<util::MultipartField> fields;
  fields.push_back({"payload_json", payload.dump(), std::nullopt, "", "application/json"});
  fields.push_back({"files[0]", "", request.path, request.filename, ""});

  auto response = transport->postMultipart(url, fields, headers);
  if (!response) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Upload of " + request.filename + " failed: " +
                                         response.error().message()));
  }
  if (!response->ok()) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Provider rejected upload of " + request.filename + ": " +
                                         describeProviderError(*response)));
  }

  auto message = parseProviderMessage(response->body);
  if (!message) {
    return std::unexpected(message.error());
  }
  if (message->attachments.empty()) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure,
                                     "Provider message " + message->id + " has no attachments"));
  }

  UploadReceipt receipt;
  receipt.message_id = message->id;
  receipt.channel_id = message->channel_id.empty() ? destination.thread_id.value_or(destination.channel_id)
                                                   : message->channel_id;
  for (const auto& ref : message->attachments) {
    receipt.attachments.push_back({ref.id, ref.url, ref.filename, ref.size});
  }

  spdlog::info("Uploaded {} as message {} in {}", request.filename, receipt.message_id,
               receipt.channel_id);
  return receipt;
}

}  // namespace attic::archive
