#pragma once
#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>

// Runtime configuration. Defaults match the behaviour of a bare install;
// fromEnvironment() overrides them with MNEMOS_* variables.
struct Settings {
    std::size_t max_review_items = 20;
    int distractor_count = 3;
    int idle_timeout_minutes = 30;

    std::string log_file = "log.log";
    spdlog::level::level_enum log_level = spdlog::level::debug;

    std::string data_dir = ".";

    static Settings fromEnvironment();
};
