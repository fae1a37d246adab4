#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rtsub {
namespace asr {

// Language tag names a Chinese variety ("zh", "zh-TW", "yue", "Chinese", "Mandarin", ...)
bool isChineseLanguage(std::string_view language);

// True when the UTF-8 text contains a CJK unified ideograph (U+4E00..U+9FFF)
bool containsCjk(std::string_view text);

/**
 * @brief Simplified -> Traditional (Taiwan phrases) conversion for Chinese transcripts
 *
 * Text is converted when the language is Chinese-family or the text contains
 * CJK ideographs; anything else passes through unchanged.
 */
class ScriptNormalizer {
   public:
    using Converter = std::function<std::string(const std::string&)>;

    explicit ScriptNormalizer(Converter converter);

    std::string normalize(std::string_view language, const std::string& text) const;

   private:
    Converter converter_;
};

// OpenCC-backed normalizer, e.g. configName "s2twp.json". Throws ConfigError if OpenCC fails.
ScriptNormalizer createOpenccNormalizer(const std::string& configName);

}  // namespace asr
}  // namespace rtsub
