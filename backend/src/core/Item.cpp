#include "Item.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>
#include <sstream>
#include <iomanip>
#include <limits>

Item::Item(const std::string& f, const std::string& b)
    : front(f), back(b)
{
    id = generateID();
    spdlog::info("Created Item: ID={}, Front={}", id, front);
}

void Item::scheduleNext(double days, std::time_t now) {
    interval = days;

    // very long intervals saturate instead of overflowing time_t
    constexpr std::time_t latest = std::numeric_limits<std::time_t>::max();
    const double seconds = days * 24.0 * 60.0 * 60.0;
    if (!(seconds < static_cast<double>(latest))) {
        next_review = latest;
    }
    else {
        const std::time_t offset = static_cast<std::time_t>(std::llround(seconds));
        if (now > 0 && offset > latest - now) next_review = latest;
        else next_review = now + offset;
    }

    spdlog::info("Item ID={} scheduled: interval={:.2f} days, next_review={}",
        id, interval, *next_review);
}

// Simple unique ID generator (timestamp + random bits)
std::string Item::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
