#include "core/languages.h"

#include <algorithm>
#include <cctype>

namespace rtsub {
namespace languages {

namespace {

std::string trim(std::string_view value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(start, end - start));
}

}  // namespace

const std::vector<Language>& supportedLanguages() {
    static const std::vector<Language> kLanguages = {
        {"zh", "Chinese"},    {"en", "English"},    {"yue", "Cantonese"}, {"ja", "Japanese"},
        {"ko", "Korean"},     {"ar", "Arabic"},     {"de", "German"},     {"fr", "French"},
        {"es", "Spanish"},    {"pt", "Portuguese"}, {"id", "Indonesian"}, {"it", "Italian"},
        {"ru", "Russian"},    {"th", "Thai"},       {"vi", "Vietnamese"}, {"tr", "Turkish"},
        {"hi", "Hindi"},      {"ms", "Malay"},      {"nl", "Dutch"},      {"sv", "Swedish"},
        {"da", "Danish"},     {"fi", "Finnish"},    {"pl", "Polish"},     {"cs", "Czech"},
        {"fil", "Filipino"},  {"fa", "Persian"},    {"el", "Greek"},      {"hu", "Hungarian"},
        {"mk", "Macedonian"}, {"ro", "Romanian"},
    };
    return kLanguages;
}

bool isSupported(std::string_view code) {
    const auto& table = supportedLanguages();
    return std::any_of(table.begin(), table.end(),
                       [&](const Language& lang) { return code == lang.code; });
}

std::string languageName(std::string_view code) {
    for (const auto& lang : supportedLanguages()) {
        if (code == lang.code) {
            return lang.name;
        }
    }
    return std::string(code);
}

Direction parseDirection(std::string_view text) {
    const std::string_view arrow(DIRECTION_ARROW);
    auto pos = text.find(arrow);
    if (pos == std::string_view::npos) {
        return Direction{};
    }
    std::string source = trim(text.substr(0, pos));
    std::string target = trim(text.substr(pos + arrow.size()));
    if (source.empty() || target.empty()) {
        return Direction{};
    }
    return Direction{source, target};
}

std::string formatDirection(const Direction& direction) {
    return direction.source + DIRECTION_ARROW + direction.target;
}

Direction swapDirection(const Direction& direction) {
    return Direction{direction.target, direction.source};
}

}  // namespace languages
}  // namespace rtsub
