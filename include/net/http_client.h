#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rtsub {
namespace net {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;  // POST body (binary safe)
    long timeoutMs = 30000;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool isSuccess() const {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief Blocking HTTP POST transport
 *
 * post() returns any HTTP status; only transport failures throw
 * (RemoteServiceError with kind Timeout or Transport).
 */
class HttpClient {
   public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

// libcurl-backed client; one easy handle per request so threads can share it
class CurlHttpClient : public HttpClient {
   public:
    CurlHttpClient();
    HttpResponse post(const HttpRequest& request) override;
};

std::shared_ptr<HttpClient> createHttpClient();

std::string urlEncode(const std::string& value);

}  // namespace net
}  // namespace rtsub
