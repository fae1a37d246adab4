#pragma once

#include "asr/script_normalizer.h"
#include "net/http_client.h"

#include <memory>
#include <string>
#include <vector>

namespace rtsub {
namespace asr {

struct TranscriptResult {
    std::string language;
    std::string text;
};

/**
 * @brief Speech-to-text for one finished segment
 *
 * Throws RemoteServiceError on any failure.
 */
class Transcriber {
   public:
    virtual ~Transcriber() = default;
    virtual TranscriptResult transcribe(const std::vector<float>& samples,
                                        const std::string& languageHint) = 0;
};

/**
 * @brief Client for the remote /api/transcribe endpoint
 *
 * Posts raw float32 PCM (16 kHz mono, native byte order) and expects
 * {"language": str, "text": str}. The returned text is script-normalized.
 */
class TranscriptionClient : public Transcriber {
   public:
    TranscriptionClient(std::string baseUrl, long timeoutMs, std::shared_ptr<net::HttpClient> http,
                        ScriptNormalizer normalizer);

    TranscriptResult transcribe(const std::vector<float>& samples,
                                const std::string& languageHint) override;

    std::string endpointFor(const std::string& languageHint) const;

   private:
    std::string baseUrl_;
    long timeoutMs_;
    std::shared_ptr<net::HttpClient> http_;
    ScriptNormalizer normalizer_;
};

}  // namespace asr
}  // namespace rtsub
