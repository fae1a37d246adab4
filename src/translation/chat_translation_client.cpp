#include "translation/chat_translation_client.h"

#include "core/errors.h"
#include "logging/logger.h"
#include "translation/prompt_builder.h"

#include <nlohmann/json.hpp>

namespace rtsub {
namespace translation {

ChatTranslationClient::ChatTranslationClient(TranslationConfig config,
                                             std::shared_ptr<net::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (config_.apiKey.empty()) {
        LOG_WARN("[Translate] No API key configured; translation requests will be rejected");
    }
}

std::string ChatTranslationClient::buildRequestBody(const std::string& text,
                                                    const languages::Direction& direction) const {
    nlohmann::json body;
    body["model"] = config_.model;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", buildSystemPrompt(direction)}},
        {{"role", "user"}, {"content", text}},
    });
    body["max_tokens"] = config_.maxTokens;
    body["temperature"] = config_.temperature;
    body["response_format"] = {{"type", "json_object"}};
    return body.dump();
}

TranslationOutput ChatTranslationClient::translate(const std::string& text,
                                                   const languages::Direction& direction) {
    net::HttpRequest request;
    request.url = config_.endpoint;
    request.headers.emplace_back("Content-Type", "application/json");
    request.headers.emplace_back("Authorization", "Bearer " + config_.apiKey);
    request.body = buildRequestBody(text, direction);
    request.timeoutMs = config_.timeoutMs;

    net::HttpResponse response = http_->post(request);
    if (!response.isSuccess()) {
        throw RemoteServiceError(RemoteServiceError::Kind::HttpStatus,
                                 "translation endpoint returned HTTP " +
                                     std::to_string(response.status) + ": " +
                                     response.body.substr(0, 200),
                                 response.status);
    }

    std::string content;
    try {
        auto j = nlohmann::json::parse(response.body);
        content = j.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw RemoteServiceError(RemoteServiceError::Kind::Protocol,
                                 std::string("invalid chat completion response: ") + e.what());
    }

    TranslationOutput output = parseTranslationContent(content, text);
    LOG_INFO("[Translate] corrected={} translated={}", output.corrected, output.translated);
    return output;
}

}  // namespace translation
}  // namespace rtsub
