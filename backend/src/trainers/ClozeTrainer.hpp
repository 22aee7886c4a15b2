#pragma once
#include <memory>
#include "Trainer.hpp"
#include "SentenceGenerator.hpp"

/*
  Fill-in-the-blank mode. render() asks the SentenceGenerator for a sentence
  containing the item's front term, blanks the first case-insensitive match
  and remembers the matched text (original casing) as the expected answer.

  Without a usable generator the render future fails with GenerationUnavailable;
  there is no silent fallback to another mode.
*/
class ClozeTrainer : public Trainer {
public:
    static constexpr const char* BLANK = "____________";

    explicit ClozeTrainer(std::shared_ptr<SentenceGenerator> generator);

    TrainingMode mode() const override { return TrainingMode::FILL_IN_BLANK; }

    void bind(const Item& item) override;
    std::future<Presentation> render() override;
    GradeResult grade(const std::string& answer) override;

    const std::string& expectedAnswer() const { return expected; }

    // Jaccard similarity of the two character sets, case-insensitive. 0 if either is empty.
    static double similarity(const std::string& a, const std::string& b);
    static RecallRating ratingForSimilarity(double similarity);

    struct Blanked {
        std::string sentence;
        std::string term;
    };
    // Blanks `term` in `sentence`; falls back to a definition template built from
    // `back` when the sentence does not contain the term.
    static Blanked blankTerm(const std::string& sentence, const std::string& term, const std::string& back);

private:
    std::shared_ptr<SentenceGenerator> generator;
    Item item;
    std::string expected;
};
