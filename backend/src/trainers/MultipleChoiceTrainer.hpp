#pragma once
#include <vector>
#include "Trainer.hpp"

// Back content is the correct option; distractors come from the other lines of
// the back, topped up with generic templates. Answers are 0-based option indices.
class MultipleChoiceTrainer : public Trainer {
public:
    explicit MultipleChoiceTrainer(int distractorCount = 3);

    TrainingMode mode() const override { return TrainingMode::MULTIPLE_CHOICE; }

    void bind(const Item& item) override;
    std::future<Presentation> render() override;
    GradeResult grade(const std::string& answer) override;

    const std::vector<std::string>& options() const { return current_options; }
    int correctIndex() const { return correct_index; }

    std::vector<std::string> generateDistractors(int count) const;

private:
    int distractor_count;
    Item item;
    std::vector<std::string> current_options;
    int correct_index = -1;
};
