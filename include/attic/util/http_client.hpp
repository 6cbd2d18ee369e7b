#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "attic/common.hpp"

namespace attic::util {

struct HttpResponse {
    int status_code = 0;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// One part of a multipart/form-data body. Either `value` or `file_path` is used.
struct MultipartField {
    std::string name;
    std::string value;
    std::optional<std::filesystem::path> file_path;
    std::string filename;       // Reported filename for file parts
    std::string content_type;   // Optional explicit part type
};

// Minimal HTTP surface the archiver needs from a client
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> get(const std::string& url,
                                     const std::vector<std::string>& headers = {}) = 0;

    virtual Result<HttpResponse> post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<std::string>& headers = {}) = 0;

    virtual Result<HttpResponse> postMultipart(const std::string& url,
                                               const std::vector<MultipartField>& fields,
                                               const std::vector<std::string>& headers = {}) = 0;
};

// libcurl-backed transport; one easy handle per instance
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(long timeout_seconds = 60);
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) = default;
    HttpClient& operator=(HttpClient&&) = default;

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers = {}) override;

    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers = {}) override;

    Result<HttpResponse> postMultipart(const std::string& url,
                                       const std::vector<MultipartField>& fields,
                                       const std::vector<std::string>& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace attic::util
