#include "TrainerFactory.hpp"
#include "DirectRecallTrainer.hpp"
#include "ClozeTrainer.hpp"
#include "MultipleChoiceTrainer.hpp"

std::unique_ptr<Trainer> makeTrainer(TrainingMode mode, const TrainerOptions& options) {
    switch (mode) {
    case TrainingMode::STANDARD:
        return std::make_unique<DirectRecallTrainer>();
    case TrainingMode::FILL_IN_BLANK:
        return std::make_unique<ClozeTrainer>(options.generator);
    case TrainingMode::MULTIPLE_CHOICE:
        return std::make_unique<MultipleChoiceTrainer>(options.distractor_count);
    }
    throw std::invalid_argument("Unknown training mode");
}
