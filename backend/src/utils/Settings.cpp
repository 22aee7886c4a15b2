#include "Settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

// Reads a positive integer; anything else keeps the default and warns.
template <typename T>
void readPositive(const char* name, T& target) {
    const char* raw = envValue(name);
    if (!raw) return;

    char* end = nullptr;
    long parsed = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || parsed <= 0) {
        spdlog::warn("Ignoring {}='{}': expected a positive integer", name, raw);
        return;
    }
    target = static_cast<T>(parsed);
}

std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Settings Settings::fromEnvironment() {
    Settings s;

    readPositive("MNEMOS_MAX_REVIEW_ITEMS", s.max_review_items);
    readPositive("MNEMOS_DISTRACTOR_COUNT", s.distractor_count);
    readPositive("MNEMOS_IDLE_TIMEOUT_MINUTES", s.idle_timeout_minutes);

    if (const char* file = envValue("MNEMOS_LOG_FILE")) s.log_file = file;
    if (const char* dir = envValue("MNEMOS_DATA_DIR")) s.data_dir = dir;

    if (const char* level = envValue("MNEMOS_LOG_LEVEL")) {
        auto parsed = spdlog::level::from_str(lowered(level));
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && lowered(level) != "off") {
            spdlog::warn("Ignoring MNEMOS_LOG_LEVEL='{}': unknown level", level);
        }
        else {
            s.log_level = parsed;
        }
    }

    if (const char* debug = envValue("MNEMOS_DEBUG")) {
        if (lowered(debug) == "true") s.log_level = spdlog::level::debug;
    }

    return s;
}
