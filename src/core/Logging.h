#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace core {

// "trace|debug|info|warn|error|critical|off" plus a few aliases ("warning",
// "err", "fatal", "quiet"). Surrounding whitespace is ignored; anything else
// yields fallback.
spdlog::level::level_enum parse_log_level(std::string_view s,
                                          spdlog::level::level_enum fallback = spdlog::level::info);

struct LogInitConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    // Driver and validation-layer messages go to their own logger so they can
    // be silenced or turned up without touching the rest.
    spdlog::level::level_enum validation_level = spdlog::level::warn;
    std::string file_path; // empty => console only
    bool use_color = true;
};

// Env first, then CLI:
//   VKBASE_LOG_LEVEL, VKBASE_VALIDATION_LOG_LEVEL, VKBASE_LOG_FILE
//   --log-level <lvl>, --validation-log-level <lvl>, --log-file <path>
//   (each also as --flag=value), --no-color
LogInitConfig determine_log_config(int argc, char** argv,
                                   spdlog::level::level_enum default_level = spdlog::level::info);

// Installs the "vkbase" default logger and the "vulkan" validation logger.
// Both write to the same sinks.
void init_logging(const LogInitConfig& cfg);

// Logger for messages reported by the driver or validation layers. Falls back
// to the default logger before init_logging ran.
std::shared_ptr<spdlog::logger> validation_logger();

void shutdown_logging();

} // namespace core
