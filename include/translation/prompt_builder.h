#pragma once

#include "core/languages.h"
#include "translation/translation_backend.h"

#include <string>

namespace rtsub {
namespace translation {

// Filler words the model is asked to drop
constexpr const char* FILLER_WORDS_ZH = "痾、阿、喔、嗯、啊、那個、就是、對對對、然後、所以說";
constexpr const char* FILLER_WORDS_EN = "um, uh, like, you know, so, right, basically";

/**
 * @brief System prompt for one direction
 *
 * en→zh and zh→en get dedicated prompts; every other pair uses a generic
 * template naming both languages. All variants ask for a JSON object with
 * "corrected" and "translated".
 */
std::string buildSystemPrompt(const languages::Direction& direction);

/**
 * @brief Interpret the model's reply
 *
 * A JSON object yields its two fields ("corrected" falls back to the input
 * when missing or empty). Anything else is taken as the raw translation.
 */
TranslationOutput parseTranslationContent(const std::string& content, const std::string& input);

}  // namespace translation
}  // namespace rtsub
