#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "TrainingMode.hpp"
#include "../core/Item.hpp"
#include "../core/RecallRating.hpp"

struct Progress {
    std::size_t current = 0;
    std::size_t total = 0;
    int correct = 0;
    int incorrect = 0;
};

// What the front end shows for one item
struct Presentation {
    TrainingMode mode = TrainingMode::STANDARD;
    std::string item_id;
    std::string front;
    std::string prompt;                          // instruction line
    std::optional<std::string> blanked_sentence; // fill-in-blank only
    std::vector<std::string> options;            // multiple choice only
    Progress progress;                           // filled in by ReviewSession
};

struct SessionStatus {
    std::size_t remaining = 0;
    int reviewed = 0;
    int correct = 0;
    int incorrect = 0;
};

struct GradeResult {
    RecallRating rating = RecallRating::COMPLETE_BLACKOUT;
    bool is_correct = false;
    std::string correct_answer;
    std::string user_answer;
    std::optional<double> similarity;  // fill-in-blank only
    std::optional<int> correct_index;  // multiple choice only

    // Set by ReviewSession after scheduling; the caller persists `item`
    Item item;
    SessionStatus status;
};

/*
  One review mode: turns an item into a prompt and grades the raw answer.
  A trainer is bound to one item at a time; bind() discards any scratch state
  from the previous item.

  render() always hands back a future so the session treats every mode the same
  way. Modes that never wait return an already-satisfied future.
*/
class Trainer {
public:
    virtual ~Trainer() = default;

    virtual TrainingMode mode() const = 0;

    virtual void bind(const Item& item) = 0;
    virtual std::future<Presentation> render() = 0;
    virtual GradeResult grade(const std::string& answer) = 0;

protected:
    static std::future<Presentation> ready(Presentation presentation) {
        std::promise<Presentation> promise;
        promise.set_value(std::move(presentation));
        return promise.get_future();
    }
};
