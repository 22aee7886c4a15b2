#include "DirectRecallTrainer.hpp"
#include <spdlog/spdlog.h>
#include "../utils/text.hpp"

void DirectRecallTrainer::bind(const Item& it) {
    item = it;
}

std::future<Presentation> DirectRecallTrainer::render() {
    Presentation p;
    p.mode = mode();
    p.item_id = item.id;
    p.front = item.front;
    p.prompt = "Recall the answer to this flashcard:";
    return ready(std::move(p));
}

GradeResult DirectRecallTrainer::grade(const std::string& answer) {
    GradeResult result;
    result.user_answer = answer;
    result.correct_answer = item.back;

    // garbage or out-of-range self-ratings count as a blackout
    auto parsed = Text::parseInt(answer);
    if (parsed && isValidRating(*parsed)) {
        result.rating = ratingFromInt(*parsed);
    }
    else {
        spdlog::debug("Unusable self-rating '{}' for item {}; treating as 0", answer, item.id);
        result.rating = RecallRating::COMPLETE_BLACKOUT;
    }

    result.is_correct = isSuccessfulRecall(result.rating);
    return result;
}
