#pragma once

#include "core/languages.h"

#include <string>

namespace rtsub {
namespace translation {

// Cleaned-up transcript plus its translation
struct TranslationOutput {
    std::string corrected;
    std::string translated;
};

/**
 * @brief Remote translation call, blocking
 *
 * Throws RemoteServiceError on failure.
 */
class TranslationBackend {
   public:
    virtual ~TranslationBackend() = default;
    virtual TranslationOutput translate(const std::string& text,
                                        const languages::Direction& direction) = 0;
};

}  // namespace translation
}  // namespace rtsub
