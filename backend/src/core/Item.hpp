#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

class Item {
public:
    Item() = default;
    Item(const std::string& front, const std::string& back = "");

    // Basic fields
    std::string id;          // Auto-generated
    std::string front;
    std::string back;

    // Scheduler state
    double interval = 1.0;        // Days, >= 0.2 once scheduled
    double ease_factor = 2.5;     // [1.3, 5.0]
    int review_count = 0;         // Graded reviews, failed ones included
    std::optional<std::time_t> next_review;  // Empty: never scheduled, due now

    bool isNew() const { return review_count == 0; }

    // Sets interval and moves next_review to now + days (fractional days allowed)
    void scheduleNext(double days, std::time_t now);

    // Utility
    static std::string generateID();
};
