#pragma once
#include <memory>
#include "Trainer.hpp"
#include "SentenceGenerator.hpp"

struct TrainerOptions {
    std::shared_ptr<SentenceGenerator> generator;  // fill-in-blank only
    int distractor_count = 3;                      // multiple choice only
};

std::unique_ptr<Trainer> makeTrainer(TrainingMode mode, const TrainerOptions& options);
