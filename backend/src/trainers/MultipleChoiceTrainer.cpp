#include "MultipleChoiceTrainer.hpp"
#include <algorithm>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include "../utils/text.hpp"

namespace {

// Fisher-Yates with libsodium's unbiased uniform draw
template <typename T>
void shuffleInPlace(std::vector<T>& v) {
    for (std::size_t i = v.size(); i > 1; --i) {
        std::size_t j = randombytes_uniform(static_cast<uint32_t>(i));
        std::swap(v[i - 1], v[j]);
    }
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

MultipleChoiceTrainer::MultipleChoiceTrainer(int distractorCount)
    : distractor_count(std::max(1, distractorCount))
{
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        throw std::runtime_error("libsodium initialization failed");
    }
}

void MultipleChoiceTrainer::bind(const Item& it) {
    item = it;
    current_options.clear();
    correct_index = -1;
}

std::vector<std::string> MultipleChoiceTrainer::generateDistractors(int count) const {
    std::vector<std::string> distractors;

    for (const auto& line : Text::splitLines(item.back)) {
        if (static_cast<int>(distractors.size()) >= count) break;
        std::string part = Text::trim(line);
        if (part.empty() || part == item.back || contains(distractors, part)) continue;
        distractors.push_back(part);
    }

    std::vector<std::string> generic = {
        "None of the above",
        "Not specified on the card",
        "The opposite of " + item.front,
        "A different form of " + item.front,
    };
    shuffleInPlace(generic);

    for (const auto& g : generic) {
        if (static_cast<int>(distractors.size()) >= count) break;
        if (g == item.back || contains(distractors, g)) continue;
        distractors.push_back(g);
    }

    if (static_cast<int>(distractors.size()) < count) {
        spdlog::debug("Only {} distinct distractors available for item {}", distractors.size(), item.id);
    }
    return distractors;
}

std::future<Presentation> MultipleChoiceTrainer::render() {
    std::vector<std::string> options = generateDistractors(distractor_count);
    options.insert(options.begin(), item.back);

    // track the correct option by position while shuffling
    std::vector<std::size_t> order(options.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    shuffleInPlace(order);

    current_options.clear();
    correct_index = -1;
    for (std::size_t i = 0; i < order.size(); ++i) {
        current_options.push_back(options[order[i]]);
        if (order[i] == 0) correct_index = static_cast<int>(i);
    }

    Presentation p;
    p.mode = mode();
    p.item_id = item.id;
    p.front = item.front;
    p.prompt = "Choose the correct answer:";
    p.options = current_options;
    return ready(std::move(p));
}

GradeResult MultipleChoiceTrainer::grade(const std::string& answer) {
    GradeResult result;
    result.user_answer = answer;
    result.correct_answer = item.back;
    result.correct_index = correct_index;

    auto selected = Text::parseInt(answer);
    if (!selected) {
        result.is_correct = false;
        result.rating = RecallRating::COMPLETE_BLACKOUT;
    }
    else if (*selected == correct_index) {
        result.is_correct = true;
        result.rating = RecallRating::PERFECT_RECALL;
    }
    else {
        result.is_correct = false;
        result.rating = RecallRating::INCORRECT_RECOGNIZED;
    }

    spdlog::debug("Multiple choice grade item={} answer='{}' correct_index={} rating={}",
        item.id, answer, correct_index, static_cast<int>(result.rating));
    return result;
}
