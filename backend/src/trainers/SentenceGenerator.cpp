#include "SentenceGenerator.hpp"
#include <spdlog/spdlog.h>
#include "../utils/text.hpp"

std::optional<std::string> BackContentSentenceGenerator::generateSentence(const std::string& term,
    const std::string& context)
{
    const std::string needle = Text::trim(term);
    if (needle.empty()) return std::nullopt;

    // sentences end at '.', '!', '?' or a line break
    std::string current;
    auto consider = [&](const std::string& raw) -> std::optional<std::string> {
        std::string sentence = Text::trim(raw);
        if (!sentence.empty() && Text::findIgnoreCase(sentence, needle))
            return sentence;
        return std::nullopt;
    };

    for (char ch : context) {
        if (ch == '\n') {
            if (auto hit = consider(current)) return hit;
            current.clear();
            continue;
        }
        current.push_back(ch);
        if (ch == '.' || ch == '!' || ch == '?') {
            if (auto hit = consider(current)) return hit;
            current.clear();
        }
    }
    if (auto hit = consider(current)) return hit;

    spdlog::debug("No sentence in back content mentions '{}'", term);
    return std::nullopt;
}
