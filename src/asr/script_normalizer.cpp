#include "asr/script_normalizer.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <opencc/opencc.h>

namespace rtsub {
namespace asr {

bool isChineseLanguage(std::string_view language) {
    std::string lower(language);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.empty()) {
        return false;
    }
    if (lower == "zh" || lower.rfind("zh-", 0) == 0 || lower.rfind("zh_", 0) == 0 ||
        lower == "yue") {
        return true;
    }
    for (const char* keyword : {"chinese", "mandarin", "cantonese"}) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool containsCjk(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }
        // U+4E00..U+9FFF are all three-byte sequences
        if ((lead & 0xF0) == 0xE0 && i + 2 < text.size()) {
            uint32_t cp = (static_cast<uint32_t>(lead & 0x0F) << 12) |
                          (static_cast<uint32_t>(static_cast<unsigned char>(text[i + 1]) & 0x3F)
                           << 6) |
                          static_cast<uint32_t>(static_cast<unsigned char>(text[i + 2]) & 0x3F);
            if (cp >= 0x4E00 && cp <= 0x9FFF) {
                return true;
            }
            i += 3;
        } else if ((lead & 0xE0) == 0xC0) {
            i += 2;
        } else if ((lead & 0xF8) == 0xF0) {
            i += 4;
        } else {
            ++i;
        }
    }
    return false;
}

ScriptNormalizer::ScriptNormalizer(Converter converter) : converter_(std::move(converter)) {}

std::string ScriptNormalizer::normalize(std::string_view language, const std::string& text) const {
    if (text.empty() || !converter_) {
        return text;
    }
    if (isChineseLanguage(language) || containsCjk(text)) {
        return converter_(text);
    }
    return text;
}

ScriptNormalizer createOpenccNormalizer(const std::string& configName) {
    std::shared_ptr<opencc::SimpleConverter> converter;
    try {
        converter = std::make_shared<opencc::SimpleConverter>(configName);
    } catch (const std::exception& e) {
        throw ConfigError("OpenCC config '" + configName + "' failed to load: " + e.what());
    }
    LOG_INFO("[ASR] OpenCC converter loaded ({})", configName);
    return ScriptNormalizer(
        [converter](const std::string& text) { return converter->Convert(text); });
}

}  // namespace asr
}  // namespace rtsub
