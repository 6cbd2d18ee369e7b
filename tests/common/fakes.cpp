#include "fakes.hpp"

#include <nlohmann/json.hpp>

namespace attic::test {

class FakeHttp::Transport : public util::HttpTransport {
 public:
  explicit Transport(FakeHttp& owner) : owner_(owner) {}

  Result<util::HttpResponse> get(const std::string& url,
                                 const std::vector<std::string>& headers) override {
    return owner_.next({"GET", url, headers, "", {}});
  }

  Result<util::HttpResponse> post(const std::string& url, const std::string& body,
                                  const std::vector<std::string>& headers) override {
    return owner_.next({"POST", url, headers, body, {}});
  }

  Result<util::HttpResponse> postMultipart(const std::string& url,
                                           const std::vector<util::MultipartField>& fields,
                                           const std::vector<std::string>& headers) override {
    return owner_.next({"POST", url, headers, "", fields});
  }

 private:
  FakeHttp& owner_;
};

void FakeHttp::enqueue(int status, std::string body) {
  std::lock_guard lock(mutex_);
  responses_.push_back(util::HttpResponse{status, std::move(body)});
}

void FakeHttp::enqueueError(ErrorCode code, std::string message) {
  std::lock_guard lock(mutex_);
  responses_.push_back(std::unexpected(Error(code, std::move(message))));
}

archive::TransportFactory FakeHttp::factory() {
  return [this]() -> std::unique_ptr<util::HttpTransport> {
    return std::make_unique<Transport>(*this);
  };
}

std::vector<RecordedRequest> FakeHttp::requests() const {
  std::lock_guard lock(mutex_);
  return requests_;
}

std::size_t FakeHttp::requestCount() const {
  std::lock_guard lock(mutex_);
  return requests_.size();
}

Result<util::HttpResponse> FakeHttp::next(RecordedRequest request) {
  std::lock_guard lock(mutex_);
  requests_.push_back(std::move(request));
  if (responses_.empty()) {
    return util::HttpResponse{500, R"({"message": "no scripted response"})"};
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

std::string providerMessageJson(const std::string& message_id, const std::string& channel_id,
                                const std::string& attachment_id, const std::string& filename,
                                std::uint64_t size, const std::string& url) {
  nlohmann::json attachment;
  attachment["id"] = attachment_id;
  attachment["filename"] = filename;
  attachment["size"] = size;
  attachment["url"] = url;
  attachment["proxy_url"] = url;

  nlohmann::json message;
  message["id"] = message_id;
  message["channel_id"] = channel_id;
  message["attachments"] = nlohmann::json::array({attachment});
  return message.dump();
}

bool LinearImageCodec::supports(const std::filesystem::path& path) const {
  auto ext = path.extension().string();
  return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

Result<archive::RasterImage> LinearImageCodec::decode(const std::filesystem::path& path) {
  (void)path;
  if (fail_decode) {
    return std::unexpected(makeError(ErrorCode::kParseError, "corrupt image"));
  }
  archive::RasterImage image;
  image.width = 4;
  image.height = 4;
  image.pixels.assign(4 * 4 * 3, 0x80);
  return image;
}

Result<std::string> LinearImageCodec::encodeJpeg(const archive::RasterImage& image, int quality) {
  (void)image;
  qualities_.push_back(quality);
  return std::string(static_cast<std::size_t>(quality) * bytes_per_quality_, 'j');
}

Result<archive::UploadReceipt> RecordingUploader::upload(const archive::UploadRequest& request,
                                                         const archive::RouteDecision& destination,
                                                         const archive::Credentials& credentials,
                                                         bool use_fallback) {
  Call call{request, destination, credentials, use_fallback, 0};
  std::error_code ec;
  auto size = std::filesystem::file_size(request.path, ec);
  call.size_on_disk = ec ? 0 : size;
  calls.push_back(call);

  if (fail) {
    return std::unexpected(makeError(ErrorCode::kUploadFailure, "HTTP 500: provider unavailable"));
  }

  archive::UploadReceipt receipt;
  receipt.message_id = "m" + std::to_string(calls.size());
  receipt.channel_id = destination.thread_id.value_or(destination.channel_id);
  receipt.attachments.push_back(archive::Attachment{"a" + std::to_string(calls.size()),
                                                    "https://cdn.example.test/" + request.filename,
                                                    request.filename, call.size_on_disk});
  return receipt;
}

}  // namespace attic::test
