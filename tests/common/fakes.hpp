#pragma once

#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "attic/archive/image_codec.hpp"
#include "attic/archive/uploader.hpp"
#include "attic/util/http_client.hpp"

namespace attic::test {

struct RecordedRequest {
  std::string method;
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  std::vector<util::MultipartField> fields;
};

/**
 * @brief Scripted HTTP transport
 *
 * Responses are served in FIFO order across all transports made by
 * factory(); with the queue empty every call answers 500.
 */
class FakeHttp {
 public:
  void enqueue(int status, std::string body);
  void enqueueError(ErrorCode code, std::string message);

  archive::TransportFactory factory();

  std::vector<RecordedRequest> requests() const;
  std::size_t requestCount() const;

 private:
  class Transport;

  Result<util::HttpResponse> next(RecordedRequest request);

  mutable std::mutex mutex_;
  std::deque<Result<util::HttpResponse>> responses_;
  std::vector<RecordedRequest> requests_;
};

// Message JSON the provider returns for one attachment
std::string providerMessageJson(const std::string& message_id, const std::string& channel_id,
                                const std::string& attachment_id, const std::string& filename,
                                std::uint64_t size,
                                const std::string& url = "https://cdn.example.test/a/file");

/**
 * @brief Codec whose output size is linear in quality
 *
 * encodeJpeg() returns `quality * bytes_per_quality` bytes, so tests can
 * pick the exact quality at which a limit is met.
 */
class LinearImageCodec : public archive::ImageCodec {
 public:
  explicit LinearImageCodec(std::size_t bytes_per_quality) : bytes_per_quality_(bytes_per_quality) {}

  bool supports(const std::filesystem::path& path) const override;
  Result<archive::RasterImage> decode(const std::filesystem::path& path) override;
  Result<std::string> encodeJpeg(const archive::RasterImage& image, int quality) override;

  const std::vector<int>& qualities() const { return qualities_; }
  bool fail_decode = false;

 private:
  std::size_t bytes_per_quality_;
  std::vector<int> qualities_;
};

// Uploader that records calls and answers with a canned receipt
class RecordingUploader : public archive::Uploader {
 public:
  Result<archive::UploadReceipt> upload(const archive::UploadRequest& request,
                                        const archive::RouteDecision& destination,
                                        const archive::Credentials& credentials,
                                        bool use_fallback) override;

  struct Call {
    archive::UploadRequest request;
    archive::RouteDecision destination;
    archive::Credentials credentials;
    bool use_fallback = false;
    std::uint64_t size_on_disk = 0;
  };

  std::vector<Call> calls;
  bool fail = false;
};

}  // namespace attic::test
