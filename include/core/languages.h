#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtsub {
namespace languages {

// Separator used in "en→zh" style direction strings
constexpr const char* DIRECTION_ARROW = "→";

struct Language {
    const char* code;
    const char* name;
};

/**
 * @brief Ordered source -> target language pair
 */
struct Direction {
    std::string source = "en";
    std::string target = "zh";

    bool operator==(const Direction& other) const {
        return source == other.source && target == other.target;
    }
    bool operator!=(const Direction& other) const {
        return !(*this == other);
    }
};

const std::vector<Language>& supportedLanguages();

bool isSupported(std::string_view code);

// English display name, or the code itself when unknown
std::string languageName(std::string_view code);

/**
 * @brief Parse "src→tgt"
 *
 * Malformed strings (no arrow, empty side) yield the default en→zh pair.
 */
Direction parseDirection(std::string_view text);

std::string formatDirection(const Direction& direction);

Direction swapDirection(const Direction& direction);

}  // namespace languages
}  // namespace rtsub
