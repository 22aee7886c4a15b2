#pragma once
#include <stdexcept>
#include <string>

// SM-2 quality-of-recall scale. 3 and above counts as a successful recall.
enum class RecallRating {
    COMPLETE_BLACKOUT = 0,     // no memory at all
    INCORRECT_RECOGNIZED = 1,  // wrong, but recognized once shown
    INCORRECT_FAMILIAR = 2,    // wrong, answer felt familiar
    CORRECT_DIFFICULT = 3,
    CORRECT_HESITATION = 4,
    PERFECT_RECALL = 5
};

inline bool isSuccessfulRecall(RecallRating rating) {
    return static_cast<int>(rating) >= static_cast<int>(RecallRating::CORRECT_DIFFICULT);
}

inline bool isValidRating(int value) {
    return value >= 0 && value <= 5;
}

// Throws on values outside 0..5; callers passing those have a bug.
inline RecallRating ratingFromInt(int value) {
    if (!isValidRating(value)) {
        throw std::invalid_argument("Recall rating out of range: " + std::to_string(value));
    }
    return static_cast<RecallRating>(value);
}
