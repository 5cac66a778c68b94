#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Call once, before the engine is built. level is any spdlog level name
    // ("trace", "debug", "info", "warn", ...); unknown names mean info.
    inline void init(const std::string& path = "flagforge.log", const std::string& level = "info")
    {
        auto file_logger = spdlog::basic_logger_mt("flagforge", path);
        spdlog::set_default_logger(file_logger);

        // Pattern is global; set it after the default logger is in place
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off") {
            lvl = spdlog::level::info;
        }
        spdlog::set_level(lvl);
        spdlog::flush_on(spdlog::level::info);
    }
}
