#pragma once
#include <vector>
#include <ctime>
#include <spdlog/spdlog.h>
#include "Item.hpp"
#include "RecallRating.hpp"

/*
  SM-2 scheduler.
   - easiness moves by 0.1 - (5 - q) * (0.08 + (5 - q) * 0.02), clamped to [1.3, 5.0]
   - successful reviews grow the interval 1 -> 6 -> interval * previous easiness
   - failed reviews shrink the interval to 20% (never below 0.2 days)
  Holds no per-item state; everything lives on the Item.
*/

class Scheduler {
public:
    Scheduler();

    // Applies one graded review to the item. Throws std::invalid_argument if the
    // rating is outside 0..5.
    void schedule(Item& item, RecallRating rating, std::time_t now) const;

    // No due time means the item was never scheduled and is due immediately.
    bool isDue(const Item& item, std::time_t now) const;

    // Due items ordered for review: never-reviewed first (input order kept),
    // then previously reviewed ones, most overdue first.
    std::vector<const Item*> getDueItems(const std::vector<Item>& items, std::time_t now) const;

    // Back to the state of a freshly created item, due again in one day.
    void resetItem(Item& item, std::time_t now) const;

    double minEase() const { return ease_min; }
    double maxEase() const { return ease_max; }
    double minInterval() const { return min_interval_days; }

private:
    double computeEaseDelta(int quality) const;
    double computeNewInterval(const Item& item, int quality, double previous_interval, double previous_ease) const;

    // Tunables
    double ease_min;
    double ease_max;
    double initial_ease;
    double lapse_interval_modifier;
    double min_interval_days;
    double first_interval_days;
    double second_interval_days;
};
