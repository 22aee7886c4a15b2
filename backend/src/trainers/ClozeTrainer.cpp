#include "ClozeTrainer.hpp"
#include <set>
#include <utility>
#include <spdlog/spdlog.h>
#include "../utils/text.hpp"

ClozeTrainer::ClozeTrainer(std::shared_ptr<SentenceGenerator> gen)
    : generator(std::move(gen))
{
}

void ClozeTrainer::bind(const Item& it) {
    item = it;
    expected.clear();
}

std::future<Presentation> ClozeTrainer::render() {
    const std::string term = Text::trim(item.front);

    // The generator may block; run it off the caller's thread so only this
    // session waits on it.
    return std::async(std::launch::async,
        [this, gen = generator, term, front = item.front, back = item.back, id = item.id]() -> Presentation {
            if (!gen) {
                spdlog::error("Fill-in-blank render for item {} without a sentence generator", id);
                throw GenerationUnavailable("Fill-in-blank mode requires a sentence generator but none is available");
            }
            if (term.empty()) {
                throw GenerationUnavailable("Item " + id + " has no front term to blank out");
            }

            std::optional<std::string> sentence;
            try {
                sentence = gen->generateSentence(term, back);
            }
            catch (const std::exception& e) {
                spdlog::error("Sentence generation failed for item {}: {}", id, e.what());
                throw GenerationUnavailable(std::string("Sentence generation failed: ") + e.what());
            }
            if (!sentence) {
                spdlog::warn("Sentence generator unavailable for item {}", id);
                throw GenerationUnavailable("Sentence generator is unavailable");
            }

            Blanked blanked = blankTerm(*sentence, term, back);
            expected = blanked.term;

            Presentation p;
            p.mode = TrainingMode::FILL_IN_BLANK;
            p.item_id = id;
            p.front = front;
            p.prompt = "Fill in the blank with the missing word:";
            p.blanked_sentence = blanked.sentence;

            spdlog::info("Generated fill-in-blank for item {}: {}", id, blanked.sentence);
            return p;
        });
}

ClozeTrainer::Blanked ClozeTrainer::blankTerm(const std::string& sentence,
    const std::string& term, const std::string& back)
{
    Blanked out;
    if (auto match = Text::findIgnoreCase(sentence, term)) {
        out.term = sentence.substr(match->first, match->second);
        out.sentence = sentence.substr(0, match->first) + BLANK + sentence.substr(match->first + match->second);
        return out;
    }

    spdlog::warn("Term '{}' not found in generated sentence, using definition template", term);
    const std::string definition = back.substr(0, back.find('.'));
    out.term = term;
    out.sentence = std::string("The term ") + BLANK + " refers to " + definition + ".";
    return out;
}

double ClozeTrainer::similarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0.0;

    const std::u32string lower_a = Text::codePoints(Text::toLower(a));
    const std::u32string lower_b = Text::codePoints(Text::toLower(b));
    std::set<char32_t> set_a(lower_a.begin(), lower_a.end());
    std::set<char32_t> set_b(lower_b.begin(), lower_b.end());

    std::size_t common = 0;
    for (char32_t c : set_a) {
        if (set_b.count(c)) ++common;
    }
    const std::size_t united = set_a.size() + set_b.size() - common;
    return united > 0 ? static_cast<double>(common) / static_cast<double>(united) : 0.0;
}

// Never 0: an answer was typed, so this is at worst "recognized".
RecallRating ClozeTrainer::ratingForSimilarity(double s) {
    if (s > 0.8) return RecallRating::PERFECT_RECALL;
    if (s > 0.6) return RecallRating::CORRECT_HESITATION;
    if (s > 0.4) return RecallRating::CORRECT_DIFFICULT;
    if (s > 0.2) return RecallRating::INCORRECT_FAMILIAR;
    return RecallRating::INCORRECT_RECOGNIZED;
}

GradeResult ClozeTrainer::grade(const std::string& answer) {
    const std::string target = expected.empty() ? Text::trim(item.front) : expected;

    GradeResult result;
    result.user_answer = answer;
    result.correct_answer = target;

    const double sim = similarity(Text::toLower(Text::trim(answer)), Text::toLower(target));
    result.similarity = sim;
    result.rating = ratingForSimilarity(sim);
    result.is_correct = isSuccessfulRecall(result.rating);

    spdlog::debug("Cloze grade item={} similarity={:.3f} rating={}",
        item.id, sim, static_cast<int>(result.rating));
    return result;
}
