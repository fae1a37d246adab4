#include "asr/transcription_client.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <nlohmann/json.hpp>

namespace rtsub {
namespace asr {

TranscriptionClient::TranscriptionClient(std::string baseUrl, long timeoutMs,
                                         std::shared_ptr<net::HttpClient> http,
                                         ScriptNormalizer normalizer)
    : baseUrl_(std::move(baseUrl)),
      timeoutMs_(timeoutMs),
      http_(std::move(http)),
      normalizer_(std::move(normalizer)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

std::string TranscriptionClient::endpointFor(const std::string& languageHint) const {
    std::string url = baseUrl_ + "/api/transcribe";
    if (!languageHint.empty()) {
        url += "?language=" + net::urlEncode(languageHint);
    }
    return url;
}

TranscriptResult TranscriptionClient::transcribe(const std::vector<float>& samples,
                                                 const std::string& languageHint) {
    net::HttpRequest request;
    request.url = endpointFor(languageHint);
    request.headers.emplace_back("Content-Type", "application/octet-stream");
    request.body.assign(reinterpret_cast<const char*>(samples.data()),
                        samples.size() * sizeof(float));
    request.timeoutMs = timeoutMs_;

    net::HttpResponse response = http_->post(request);
    if (!response.isSuccess()) {
        throw RemoteServiceError(RemoteServiceError::Kind::HttpStatus,
                                 "ASR server returned HTTP " + std::to_string(response.status) +
                                     ": " + response.body.substr(0, 200),
                                 response.status);
    }

    TranscriptResult result;
    try {
        auto j = nlohmann::json::parse(response.body);
        if (!j.is_object()) {
            throw RemoteServiceError(RemoteServiceError::Kind::Protocol,
                                     "ASR response is not a JSON object");
        }
        result.language = j.value("language", "");
        result.text = j.value("text", "");
    } catch (const nlohmann::json::exception& e) {
        throw RemoteServiceError(RemoteServiceError::Kind::Protocol,
                                 std::string("invalid ASR response: ") + e.what());
    }

    result.text = normalizer_.normalize(result.language, result.text);
    LOG_DEBUG("[ASR] lang={} text={}", result.language, result.text);
    return result;
}

}  // namespace asr
}  // namespace rtsub
