#pragma once

#include "core/config_loader.h"
#include "net/http_client.h"
#include "translation/translation_backend.h"

#include <memory>
#include <string>

namespace rtsub {
namespace translation {

/**
 * @brief OpenAI-compatible chat-completion translator
 *
 * Sends the direction's system prompt plus the transcript, requests a JSON
 * object reply and parses it with parseTranslationContent().
 */
class ChatTranslationClient : public TranslationBackend {
   public:
    ChatTranslationClient(TranslationConfig config, std::shared_ptr<net::HttpClient> http);

    TranslationOutput translate(const std::string& text,
                                const languages::Direction& direction) override;

    // Request body for one call; exposed for tests
    std::string buildRequestBody(const std::string& text,
                                 const languages::Direction& direction) const;

   private:
    TranslationConfig config_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace translation
}  // namespace rtsub
