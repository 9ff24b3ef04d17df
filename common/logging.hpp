#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace voxlasm {
namespace logging {

// Map a level name (trace, debug, info, warn, error, off) to an spdlog level
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("voxlasm");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("VOXLASM_LOG_LEVEL");
        auto level = level_env ? parse_level(level_env) : std::nullopt;
        log->set_level(level.value_or(spdlog::level::info));

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace voxlasm
