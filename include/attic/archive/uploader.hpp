#pragma once

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "attic/archive/types.hpp"
#include "attic/common.hpp"
#include "attic/util/http_client.hpp"

namespace attic::archive {

struct UploadRequest {
  std::filesystem::path path;
  std::string filename;  // Name the provider shows for the attachment
};

/**
 * @brief Sends one file to the storage provider
 *
 * Transport and provider errors surface as kUploadFailure. There is no
 * retry at this layer: calling upload() twice for the same bytes creates
 * two remote objects.
 */
class Uploader {
 public:
  virtual ~Uploader() = default;

  virtual Result<UploadReceipt> upload(const UploadRequest& request,
                                       const RouteDecision& destination,
                                       const Credentials& credentials,
                                       bool use_fallback) = 0;

  // Runs upload() on its own thread. The uploader must outlive the future.
  std::future<Result<UploadReceipt>> uploadAsync(UploadRequest request,
                                                 RouteDecision destination,
                                                 Credentials credentials,
                                                 bool use_fallback);
};

using TransportFactory = std::function<std::unique_ptr<util::HttpTransport>()>;

/**
 * @brief Chat-platform uploader
 *
 * Primary mode posts a message with the file to
 * `<api_base>/channels/<thread or channel>/messages` using the bot token.
 * Fallback mode posts to the destination's webhook with `wait=true`.
 * Each call builds a fresh transport from the factory.
 */
class ChatUploader : public Uploader {
 public:
  ChatUploader(std::string api_base, TransportFactory transport_factory);

  Result<UploadReceipt> upload(const UploadRequest& request,
                               const RouteDecision& destination,
                               const Credentials& credentials,
                               bool use_fallback) override;

 private:
  Result<UploadReceipt> send(const std::string& url,
                             const std::vector<std::string>& headers,
                             const UploadRequest& request,
                             const RouteDecision& destination);

  std::string api_base_;
  TransportFactory transport_factory_;
};

}  // namespace attic::archive
