#include "ReviewSession.hpp"
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include "../trainers/SentenceGenerator.hpp"

std::string toString(SessionState state) {
    switch (state) {
    case SessionState::EMPTY: return "empty";
    case SessionState::READY: return "ready";
    case SessionState::PRESENTING: return "presenting";
    case SessionState::ENDED: return "ended";
    }
    return "empty";
}

ReviewSession::ReviewSession(std::string userId, TrainingMode mode, TrainerOptions options,
    std::size_t maxItems)
    : user_id(std::move(userId)),
    trainer_options(std::move(options)),
    max_items(maxItems),
    training_mode(mode),
    started_at(std::time(nullptr)),
    started_clock(std::chrono::steady_clock::now()),
    last_activity(started_at)
{
    spdlog::info("Created review session for user {} with mode {}", user_id, toString(mode));
}

void ReviewSession::requireNotEnded(const char* operation) const {
    if (current_state == SessionState::ENDED) {
        spdlog::error("{}() called on ended session of user {}", operation, user_id);
        throw std::logic_error(std::string(operation) + "() called on an ended review session");
    }
}

std::size_t ReviewSession::loadQueue(const std::vector<Item>& items, std::time_t now) {
    std::lock_guard<std::mutex> lock(mtx);
    requireNotEnded("loadQueue");
    if (current_state == SessionState::PRESENTING) {
        throw std::logic_error("loadQueue() called while an item awaits grading");
    }

    queue.clear();
    for (const Item* item : scheduler.getDueItems(items, now)) {
        if (queue.size() >= max_items) break;
        queue.push_back(*item);
    }

    current_state = queue.empty() ? SessionState::EMPTY : SessionState::READY;
    last_activity = std::time(nullptr);

    spdlog::info("Loaded {} due items out of {} total for user {}", queue.size(), items.size(), user_id);
    return queue.size();
}

Progress ReviewSession::progressLocked() const {
    Progress p;
    p.current = static_cast<std::size_t>(items_reviewed) + 1;
    p.total = static_cast<std::size_t>(items_reviewed) + 1 + queue.size();
    p.correct = correct_answers;
    p.incorrect = incorrect_answers;
    return p;
}

SessionStatus ReviewSession::statusLocked() const {
    SessionStatus s;
    s.remaining = queue.size();
    s.reviewed = items_reviewed;
    s.correct = correct_answers;
    s.incorrect = incorrect_answers;
    return s;
}

ReviewSession::Next ReviewSession::advance() {
    std::lock_guard<std::mutex> lock(mtx);
    requireNotEnded("advance");
    if (current_state == SessionState::PRESENTING) {
        spdlog::error("advance() for user {} while item {} awaits grading", user_id, current->id);
        throw std::logic_error("advance() called while an item awaits grading");
    }
    last_activity = std::time(nullptr);

    if (queue.empty()) {
        current_state = SessionState::EMPTY;
        spdlog::info("No more items in the review queue for user {}", user_id);
        return QueueExhausted{};
    }

    // the item leaves the queue only once a trainer holds it
    if (!trainer || trainer->mode() != training_mode) {
        trainer = makeTrainer(training_mode, trainer_options);
    }
    trainer->bind(queue.front());
    current = std::move(queue.front());
    queue.pop_front();
    current_state = SessionState::PRESENTING;

    // progress counts the current item as part of the remaining work
    const Progress progress = progressLocked();

    std::future<Presentation> pending = trainer->render();
    try {
        Presentation presentation = pending.get();
        presentation.progress = progress;
        spdlog::info("Prepared item {} for user {} in {} mode ({}/{})",
            current->id, user_id, toString(training_mode), progress.current, progress.total);
        return presentation;
    }
    catch (const GenerationUnavailable& e) {
        spdlog::error("Cannot render item {} in {} mode: {}", current->id, toString(training_mode), e.what());

        RenderFailure failure;
        failure.mode = training_mode;
        failure.item_id = current->id;
        failure.message = e.what();
        failure.progress = progress;

        queue.push_front(std::move(*current));
        current.reset();
        current_state = SessionState::READY;
        return failure;
    }
    catch (const std::exception& e) {
        spdlog::error("Unexpected render error for item {}: {}", current->id, e.what());
        queue.push_front(std::move(*current));
        current.reset();
        current_state = SessionState::READY;
        throw;
    }
}

GradeResult ReviewSession::grade(const std::string& answer) {
    return grade(answer, std::time(nullptr));
}

GradeResult ReviewSession::grade(const std::string& answer, std::time_t now) {
    std::lock_guard<std::mutex> lock(mtx);
    requireNotEnded("grade");
    if (current_state != SessionState::PRESENTING || !current) {
        spdlog::error("grade() for user {} with no current item", user_id);
        throw std::logic_error("No current item being reviewed");
    }

    GradeResult result = trainer->grade(answer);
    scheduler.schedule(*current, result.rating, now);

    items_reviewed += 1;
    if (result.is_correct) correct_answers += 1;
    else incorrect_answers += 1;

    reviewed.push_back(ReviewedEntry{ *current, result.rating });

    result.item = *current;
    result.status = statusLocked();

    spdlog::info("Processed answer for item {} (user {}), rating: {}, correct: {}",
        current->id, user_id, static_cast<int>(result.rating), result.is_correct);

    current.reset();
    current_state = queue.empty() ? SessionState::EMPTY : SessionState::READY;
    last_activity = std::time(nullptr);
    return result;
}

SessionSummary ReviewSession::end() {
    std::lock_guard<std::mutex> lock(mtx);
    if (summary) return *summary;

    SessionSummary s;
    s.user_id = user_id;
    s.mode = training_mode;
    s.started_at = started_at;
    s.items_reviewed = items_reviewed;
    s.correct = correct_answers;
    s.incorrect = incorrect_answers;
    s.accuracy = items_reviewed == 0
        ? 0.0
        : static_cast<double>(correct_answers) / static_cast<double>(items_reviewed);
    s.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_clock).count();

    // whatever is still queued keeps its original schedule
    const std::size_t discarded = queue.size() + (current ? 1 : 0);
    queue.clear();
    current.reset();
    current_state = SessionState::ENDED;
    summary = s;

    spdlog::info("Ended review session for user {}, reviewed {} items ({} correct), {} left unreviewed",
        user_id, s.items_reviewed, s.correct, discarded);
    return s;
}

void ReviewSession::switchMode(TrainingMode mode) {
    std::lock_guard<std::mutex> lock(mtx);
    requireNotEnded("switchMode");
    if (current_state == SessionState::PRESENTING) {
        throw std::logic_error("switchMode() called while an item awaits grading");
    }
    spdlog::info("User {} switched review mode {} -> {}", user_id, toString(training_mode), toString(mode));
    training_mode = mode;
    trainer.reset();
    last_activity = std::time(nullptr);
}

TrainingMode ReviewSession::mode() const {
    std::lock_guard<std::mutex> lock(mtx);
    return training_mode;
}

SessionState ReviewSession::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current_state;
}

std::size_t ReviewSession::remaining() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
}

std::optional<Item> ReviewSession::currentItem() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

std::vector<ReviewedEntry> ReviewSession::history() const {
    std::lock_guard<std::mutex> lock(mtx);
    return reviewed;
}

std::time_t ReviewSession::lastActivity() const {
    std::lock_guard<std::mutex> lock(mtx);
    return last_activity;
}
