#pragma once
#include <stdexcept>
#include <string>

enum class TrainingMode {
    STANDARD,          // direct recall, self-rated
    FILL_IN_BLANK,     // cloze sentence, graded by similarity
    MULTIPLE_CHOICE
};

inline std::string toString(TrainingMode mode) {
    switch (mode) {
    case TrainingMode::STANDARD: return "standard";
    case TrainingMode::FILL_IN_BLANK: return "fill_in_blank";
    case TrainingMode::MULTIPLE_CHOICE: return "multiple_choice";
    }
    return "standard";
}

inline TrainingMode trainingModeFromString(const std::string& value) {
    if (value == "standard") return TrainingMode::STANDARD;
    if (value == "fill_in_blank") return TrainingMode::FILL_IN_BLANK;
    if (value == "multiple_choice") return TrainingMode::MULTIPLE_CHOICE;
    throw std::invalid_argument("Unknown training mode: " + value);
}

// Short user-facing description of each mode
inline std::string modeExplanation(TrainingMode mode) {
    switch (mode) {
    case TrainingMode::STANDARD:
        return "Standard mode: you see the front of each item and recall the answer, "
            "then rate how well you remembered it on a scale of 0-5.";
    case TrainingMode::FILL_IN_BLANK:
        return "Fill-in-the-blank mode: a sentence is shown with the term blanked out. "
            "Type the missing word; it is scored by how close it is to the correct term.";
    case TrainingMode::MULTIPLE_CHOICE:
        return "Multiple choice mode: pick the correct answer from the listed options. "
            "This tests recognition rather than recall.";
    }
    return "Mode explanation not available.";
}
