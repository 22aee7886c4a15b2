#pragma once
#include "Trainer.hpp"

// Shows the front only; the learner's answer *is* their 0-5 self-rating.
class DirectRecallTrainer : public Trainer {
public:
    TrainingMode mode() const override { return TrainingMode::STANDARD; }

    void bind(const Item& item) override;
    std::future<Presentation> render() override;
    GradeResult grade(const std::string& answer) override;

private:
    Item item;
};
