#include "SessionRegistry.hpp"
#include <spdlog/spdlog.h>

SessionRegistry::SessionRegistry(TrainerOptions options, std::size_t maxItems)
    : trainer_options(std::move(options)), max_items(maxItems)
{
    spdlog::info("SessionRegistry initialized (max {} items per session, generator: {})",
        max_items, trainer_options.generator != nullptr);
}

BeginResult SessionRegistry::begin(const std::string& userId, const std::vector<Item>& items,
    TrainingMode mode, std::time_t now)
{
    BeginResult result;

    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = sessions.find(userId);
        if (it != sessions.end()) {
            spdlog::warn("User {} already has an active review session", userId);
            result.status = BeginStatus::ALREADY_ACTIVE;
            result.session = it->second;
            return result;
        }
    }

    if (mode == TrainingMode::FILL_IN_BLANK && !trainer_options.generator) {
        spdlog::error("{} mode requested by user {} but no sentence generator is configured",
            toString(mode), userId);
        result.status = BeginStatus::MODE_UNAVAILABLE;
        return result;
    }

    // queue building stays outside the registry lock
    auto session = std::make_shared<ReviewSession>(userId, mode, trainer_options, max_items);
    result.items_due = session->loadQueue(items, now);
    if (result.items_due == 0) {
        spdlog::info("No due items for user {}", userId);
        result.status = BeginStatus::NOTHING_DUE;
        return result;
    }

    std::lock_guard<std::mutex> lock(mtx);
    auto inserted = sessions.emplace(userId, session);
    if (!inserted.second) {
        // lost a race with a concurrent begin() for the same user
        spdlog::warn("User {} started another session concurrently", userId);
        result.status = BeginStatus::ALREADY_ACTIVE;
        result.session = inserted.first->second;
        result.items_due = 0;
        return result;
    }

    spdlog::info("Started review session for user {}, mode {}, {} items due",
        userId, toString(mode), result.items_due);
    result.status = BeginStatus::STARTED;
    result.session = std::move(session);
    return result;
}

std::shared_ptr<ReviewSession> SessionRegistry::get(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(userId);
    if (it == sessions.end()) return nullptr;
    return it->second;
}

std::optional<SessionSummary> SessionRegistry::end(const std::string& userId) {
    std::shared_ptr<ReviewSession> session;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = sessions.find(userId);
        if (it == sessions.end()) {
            spdlog::warn("No active session to end for user {}", userId);
            return std::nullopt;
        }
        session = std::move(it->second);
        sessions.erase(it);
    }

    // ReviewSession::end waits on the session's own lock, not the registry's
    SessionSummary summary = session->end();
    spdlog::info("Removed review session for user {}", userId);
    return summary;
}

std::optional<SessionSummary> SessionRegistry::endIf(const std::string& userId,
    const std::shared_ptr<ReviewSession>& expected)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = sessions.find(userId);
        if (it == sessions.end() || it->second != expected) {
            spdlog::debug("Session of user {} was ended or replaced meanwhile; leaving it", userId);
            return std::nullopt;
        }
        sessions.erase(it);
    }

    SessionSummary summary = expected->end();
    spdlog::info("Removed review session for user {}", userId);
    return summary;
}

std::size_t SessionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}

std::vector<std::pair<std::string, std::shared_ptr<ReviewSession>>> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return { sessions.begin(), sessions.end() };
}
