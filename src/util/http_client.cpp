#include "attic/util/http_client.hpp"

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace attic::util {

namespace {

std::once_flag g_curl_init_flag;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Frees a header list when a request returns, whichever path it takes
struct HeaderList {
    struct curl_slist* list = nullptr;

    explicit HeaderList(const std::vector<std::string>& headers) {
        for (const auto& header : headers) {
            list = curl_slist_append(list, header.c_str());
        }
    }

    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
};

} // namespace

struct HttpClient::Impl {
    CURL* curl = nullptr;
    long timeout_seconds = 60;

    explicit Impl(long timeout) : timeout_seconds(timeout) {
        std::call_once(g_curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    // Shared tail of every request: headers, body capture, perform, status
    Result<HttpResponse> perform(const std::vector<std::string>& headers) {
        std::string response_body;
        long response_code = 0;

        HeaderList header_list(headers);
        if (header_list.list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.list);
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            return std::unexpected(makeError(ErrorCode::kNetworkError,
                                             "HTTP request failed: " + std::string(curl_easy_strerror(res))));
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        HttpResponse response;
        response.status_code = static_cast<int>(response_code);
        response.body = std::move(response_body);
        return response;
    }
};

HttpClient::HttpClient(long timeout_seconds) : pImpl(std::make_unique<Impl>(timeout_seconds)) {
}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     const std::vector<std::string>& headers) {
    if (!pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    curl_easy_reset(pImpl->curl);
    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_HTTPGET, 1L);

    return pImpl->perform(headers);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<std::string>& headers) {
    if (!pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    curl_easy_reset(pImpl->curl);
    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_POST, 1L);
    curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));

    return pImpl->perform(headers);
}

Result<HttpResponse> HttpClient::postMultipart(const std::string& url,
                                               const std::vector<MultipartField>& fields,
                                               const std::vector<std::string>& headers) {
    if (!pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    curl_easy_reset(pImpl->curl);
    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());

    curl_mime* mime = curl_mime_init(pImpl->curl);
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.name.c_str());

        if (field.file_path.has_value()) {
            // Streamed from disk by libcurl, never loaded whole
            if (curl_mime_filedata(part, field.file_path->c_str()) != CURLE_OK) {
                curl_mime_free(mime);
                return std::unexpected(makeError(ErrorCode::kFileReadError,
                                                 "Cannot attach file: " + field.file_path->string()));
            }
            if (!field.filename.empty()) {
                curl_mime_filename(part, field.filename.c_str());
            }
        } else {
            curl_mime_data(part, field.value.data(), field.value.size());
        }

        if (!field.content_type.empty()) {
            curl_mime_type(part, field.content_type.c_str());
        }
    }
    curl_easy_setopt(pImpl->curl, CURLOPT_MIMEPOST, mime);

    auto result = pImpl->perform(headers);
    curl_mime_free(mime);
    return result;
}

} // namespace attic::util
