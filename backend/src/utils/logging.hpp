#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "Settings.hpp"

namespace Log
{
    inline void init(const Settings& settings)
    {
        // File logger becomes the default; library code only talks to spdlog::*
        auto file_logger = spdlog::basic_logger_mt("file_logger", settings.log_file);
        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(settings.log_level);
        spdlog::flush_on(spdlog::level::info);
    }
}
