#include "translation/prompt_builder.h"

#include <nlohmann/json.hpp>

namespace rtsub {
namespace translation {

namespace {

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

}  // namespace

std::string buildSystemPrompt(const languages::Direction& direction) {
    if (direction.source == "en" && direction.target == "zh") {
        return std::string(
                   "You translate live subtitles. The input is raw speech recognition output in "
                   "English.\n"
                   "Return a JSON object with two fields:\n"
                   "1. corrected: fix homophones and misrecognized words, drop filler words (") +
               FILLER_WORDS_EN +
               "), and write clean, natural English.\n"
               "2. translated: translate the corrected text into Traditional Chinese as spoken "
               "in Taiwan, restructuring sentences to follow Chinese grammar.\n"
               "Format: {\"corrected\": \"corrected English\", \"translated\": \"繁體中文翻譯\"}";
    }
    if (direction.source == "zh" && direction.target == "en") {
        return std::string(
                   "You translate live subtitles. The input is raw speech recognition output in "
                   "Chinese.\n"
                   "Return a JSON object with two fields:\n"
                   "1. corrected: fix homophones and misrecognized words, drop filler words (") +
               FILLER_WORDS_ZH + ", " + FILLER_WORDS_EN +
               "), and write clean Chinese.\n"
               "2. translated: translate the corrected text into natural, colloquial English.\n"
               "Format: {\"corrected\": \"corrected Chinese\", \"translated\": \"English "
               "translation\"}";
    }

    const std::string sourceName = languages::languageName(direction.source);
    const std::string targetName = languages::languageName(direction.target);
    return "You translate live subtitles. The input is raw speech recognition output.\n"
           "Return a JSON object with two fields:\n"
           "1. corrected: fix recognition errors, drop filler words, and write clean " +
           sourceName +
           ".\n"
           "2. translated: translate the corrected text into " +
           targetName +
           ", keeping it natural.\n"
           "Format: {\"corrected\": \"corrected " +
           sourceName + "\", \"translated\": \"" + targetName + " translation\"}";
}

TranslationOutput parseTranslationContent(const std::string& content, const std::string& input) {
    const std::string stripped = trim(content);
    TranslationOutput output;

    auto j = nlohmann::json::parse(stripped, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        output.corrected = input;
        output.translated = stripped;
        return output;
    }

    auto corrected = j.find("corrected");
    if (corrected != j.end() && corrected->is_string() &&
        !corrected->get<std::string>().empty()) {
        output.corrected = corrected->get<std::string>();
    } else {
        output.corrected = input;
    }

    auto translated = j.find("translated");
    if (translated != j.end() && translated->is_string()) {
        output.translated = translated->get<std::string>();
    }
    return output;
}

}  // namespace translation
}  // namespace rtsub
