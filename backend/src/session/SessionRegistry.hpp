#pragma once
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "ReviewSession.hpp"

enum class BeginStatus {
    STARTED,
    ALREADY_ACTIVE,    // caller must end() the existing session first
    NOTHING_DUE,       // no session stored
    MODE_UNAVAILABLE   // fill-in-blank requested without a sentence generator
};

struct BeginResult {
    BeginStatus status = BeginStatus::STARTED;
    std::shared_ptr<ReviewSession> session;  // the new or the already active one
    std::size_t items_due = 0;
};

// At most one live ReviewSession per user. Owned by whoever serves requests;
// sessions of different users never share a lock beyond the short map lookups.
class SessionRegistry {
public:
    explicit SessionRegistry(TrainerOptions options, std::size_t maxItems = 20);

    BeginResult begin(const std::string& userId, const std::vector<Item>& items,
        TrainingMode mode, std::time_t now);

    std::shared_ptr<ReviewSession> get(const std::string& userId) const;

    // Removes the session and returns its summary; nullopt if the user has none.
    std::optional<SessionSummary> end(const std::string& userId);

    // Like end(), but only while `expected` is still the user's session.
    std::optional<SessionSummary> endIf(const std::string& userId,
        const std::shared_ptr<ReviewSession>& expected);

    std::size_t activeCount() const;
    std::vector<std::pair<std::string, std::shared_ptr<ReviewSession>>> snapshot() const;

private:
    TrainerOptions trainer_options;
    std::size_t max_items;

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<ReviewSession>> sessions;
};
