#pragma once
#include <chrono>
#include <ctime>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../core/Item.hpp"
#include "../core/Scheduler.hpp"
#include "../trainers/Trainer.hpp"
#include "../trainers/TrainerFactory.hpp"

enum class SessionState {
    EMPTY,       // nothing queued
    READY,       // queue loaded, no current item
    PRESENTING,  // current item rendered, waiting for grade()
    ENDED
};

std::string toString(SessionState state);

// advance() could not render the item (fill-in-blank without a generator).
// The item goes back to the head of the queue.
struct RenderFailure {
    TrainingMode mode = TrainingMode::STANDARD;
    std::string item_id;
    std::string message;
    Progress progress;
};

struct QueueExhausted {};

struct SessionSummary {
    std::string user_id;
    TrainingMode mode = TrainingMode::STANDARD;
    std::time_t started_at = 0;
    int items_reviewed = 0;
    int correct = 0;
    int incorrect = 0;
    double accuracy = 0.0;
    double duration_seconds = 0.0;
};

struct ReviewedEntry {
    Item item;  // state after scheduling
    RecallRating rating;
};

/*
  One user's pass over a batch of due items.

    EMPTY --loadQueue--> READY --advance--> PRESENTING --grade--> READY / EMPTY
    any state --end--> ENDED

  Operations on one session are serialized by its own mutex; a slow render
  (sentence generation) holds only that lock.
*/
class ReviewSession {
public:
    using Next = std::variant<Presentation, RenderFailure, QueueExhausted>;

    ReviewSession(std::string userId, TrainingMode mode, TrainerOptions options,
        std::size_t maxItems = 20);

    // Queues copies of the due items (new first, then most overdue), truncated
    // to maxItems. Returns the queue length.
    std::size_t loadQueue(const std::vector<Item>& items, std::time_t now);

    Next advance();

    // Grades the current item and schedules it at `now`. Throws std::logic_error
    // when no item is being presented.
    GradeResult grade(const std::string& answer, std::time_t now);
    GradeResult grade(const std::string& answer);

    // Idempotent: later calls return the first summary unchanged.
    SessionSummary end();

    // Valid outside PRESENTING; the next advance() uses a trainer for the new mode.
    void switchMode(TrainingMode mode);

    const std::string& userId() const { return user_id; }
    TrainingMode mode() const;
    SessionState state() const;
    std::size_t remaining() const;
    std::optional<Item> currentItem() const;
    std::vector<ReviewedEntry> history() const;
    std::time_t lastActivity() const;

private:
    Progress progressLocked() const;
    SessionStatus statusLocked() const;
    void requireNotEnded(const char* operation) const;

    const std::string user_id;
    TrainerOptions trainer_options;
    const std::size_t max_items;
    Scheduler scheduler;

    mutable std::mutex mtx;
    TrainingMode training_mode;
    SessionState current_state = SessionState::EMPTY;
    std::deque<Item> queue;
    std::optional<Item> current;
    std::unique_ptr<Trainer> trainer;

    int items_reviewed = 0;
    int correct_answers = 0;
    int incorrect_answers = 0;
    std::vector<ReviewedEntry> reviewed;

    std::time_t started_at;
    std::chrono::steady_clock::time_point started_clock;
    std::time_t last_activity;
    std::optional<SessionSummary> summary;
};
