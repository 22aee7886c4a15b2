#include "IdleSessionReaper.hpp"
#include <spdlog/spdlog.h>

IdleSessionReaper::IdleSessionReaper(SessionRegistry& reg, std::chrono::minutes idleLimit)
    : registry(reg), idle_limit(idleLimit)
{
}

IdleSessionReaper::Candidates IdleSessionReaper::idleSessions(std::time_t now) const {
    Candidates idle;
    const auto limit_seconds = std::chrono::duration_cast<std::chrono::seconds>(idle_limit).count();

    for (auto& entry : registry.snapshot()) {
        if (now - entry.second->lastActivity() >= limit_seconds) idle.push_back(std::move(entry));
    }
    return idle;
}

std::vector<std::pair<std::string, SessionSummary>> IdleSessionReaper::evict(const Candidates& candidates) {
    std::vector<std::pair<std::string, SessionSummary>> evicted;
    for (const auto& entry : candidates) {
        // the user may have ended or replaced it since it was found idle
        if (auto summary = registry.endIf(entry.first, entry.second)) {
            spdlog::info("Evicted idle session of user {}", entry.first);
            evicted.emplace_back(entry.first, *summary);
        }
    }
    return evicted;
}

std::vector<std::pair<std::string, SessionSummary>> IdleSessionReaper::reap(std::time_t now) {
    return evict(idleSessions(now));
}
