#include "Scheduler.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

Scheduler::Scheduler()
    : ease_min(1.3),
    ease_max(5.0),
    initial_ease(2.5),
    lapse_interval_modifier(0.2),
    min_interval_days(0.2),
    first_interval_days(1.0),
    second_interval_days(6.0)
{
    spdlog::debug("Scheduler (SM-2) initialized: ease=[{}, {}], min_interval={}d",
        ease_min, ease_max, min_interval_days);
}

/*
  Order of operations matters: the review count is bumped first, easiness is
  updated from the rating, and the new interval is derived from the interval
  and easiness the item had *before* this review.
*/
void Scheduler::schedule(Item& item, RecallRating rating, std::time_t now) const {
    const int q = static_cast<int>(rating);
    if (!isValidRating(q)) {
        spdlog::error("schedule() called with rating {} for item {}", q, item.id);
        throw std::invalid_argument("Recall rating out of range: " + std::to_string(q));
    }

    const double previous_ease = item.ease_factor;
    const double previous_interval = item.interval;

    item.review_count += 1;
    item.ease_factor = std::clamp(previous_ease + computeEaseDelta(q), ease_min, ease_max);

    double next = computeNewInterval(item, q, previous_interval, previous_ease);
    item.scheduleNext(next, now);

    spdlog::info("Review Item {} | q={} reviews={} ease {:.3f}->{:.3f} interval {:.3f}->{:.3f}d",
        item.id, q, item.review_count, previous_ease, item.ease_factor, previous_interval, item.interval);
}

double Scheduler::computeEaseDelta(int quality) const {
    const double miss = 5.0 - quality;
    return 0.1 - miss * (0.08 + miss * 0.02);
}

double Scheduler::computeNewInterval(const Item& item, int quality,
    double previous_interval, double previous_ease) const
{
    if (quality < static_cast<int>(RecallRating::CORRECT_DIFFICULT)) {
        // lapse: keep some spacing instead of dropping to zero
        return std::max(min_interval_days, previous_interval * lapse_interval_modifier);
    }

    if (item.review_count == 1) return first_interval_days;
    if (item.review_count == 2) return second_interval_days;

    return previous_interval * previous_ease;
}

bool Scheduler::isDue(const Item& item, std::time_t now) const {
    if (!item.next_review) return true;
    return *item.next_review <= now;
}

std::vector<const Item*> Scheduler::getDueItems(const std::vector<Item>& items, std::time_t now) const {
    std::vector<const Item*> fresh;
    std::vector<const Item*> backlog;

    for (const auto& item : items) {
        if (!isDue(item, now)) continue;
        if (item.isNew()) fresh.push_back(&item);
        else backlog.push_back(&item);
    }

    // stable so equally-due items keep their input order
    std::stable_sort(backlog.begin(), backlog.end(),
        [now](const Item* a, const Item* b) {
            return a->next_review.value_or(now) < b->next_review.value_or(now);
        });

    std::vector<const Item*> due;
    due.reserve(fresh.size() + backlog.size());
    due.insert(due.end(), fresh.begin(), fresh.end());
    due.insert(due.end(), backlog.begin(), backlog.end());

    spdlog::debug("getDueItems: {} of {} due ({} new, {} backlog)",
        due.size(), items.size(), fresh.size(), backlog.size());
    return due;
}

void Scheduler::resetItem(Item& item, std::time_t now) const {
    item.ease_factor = initial_ease;
    item.review_count = 0;
    item.scheduleNext(first_interval_days, now);
    spdlog::info("Item {} reset to initial schedule", item.id);
}
