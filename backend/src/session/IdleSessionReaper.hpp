#pragma once
#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "SessionRegistry.hpp"

// Ends sessions nobody has touched for `idleLimit`. Lives in the serving
// layer next to the registry; the session engine itself has no timeouts.
class IdleSessionReaper {
public:
    using Candidates = std::vector<std::pair<std::string, std::shared_ptr<ReviewSession>>>;

    IdleSessionReaper(SessionRegistry& registry, std::chrono::minutes idleLimit);

    // Sessions idle for at least the limit at `now`.
    Candidates idleSessions(std::time_t now) const;

    // Ends each candidate that is still the registered session of its user.
    std::vector<std::pair<std::string, SessionSummary>> evict(const Candidates& candidates);

    std::vector<std::pair<std::string, SessionSummary>> reap(std::time_t now);

private:
    SessionRegistry& registry;
    std::chrono::minutes idle_limit;
};
