#include "net/http_client.h"

#include "core/errors.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace rtsub {
namespace net {

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CurlHttpClient::CurlHttpClient() {
    ensureCurlGlobalInit();
}

HttpResponse CurlHttpClient::post(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw RemoteServiceError(RemoteServiceError::Kind::Transport, "curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            throw RemoteServiceError(RemoteServiceError::Kind::Transport,
                                     "failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }

    HttpResponse response;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(request.timeoutMs, 10000L));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string message = errorBuffer[0] ? errorBuffer : curl_easy_strerror(rc);
        auto kind = (rc == CURLE_OPERATION_TIMEDOUT) ? RemoteServiceError::Kind::Timeout
                                                     : RemoteServiceError::Kind::Transport;
        throw RemoteServiceError(kind, request.url + ": " + message);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::shared_ptr<HttpClient> createHttpClient() {
    return std::make_shared<CurlHttpClient>();
}

std::string urlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

}  // namespace net
}  // namespace rtsub
