#include "Logging.h"

#include <array>
#include <chrono>
#include <cstdlib>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace core {

namespace {

constexpr const char* kDefaultLogger = "vkbase";
constexpr const char* kValidationLogger = "vulkan";

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 13> kLevelNames{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"crit", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"none", spdlog::level::off},
    {"quiet", spdlog::level::off},
}};

std::string_view strip(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    const size_t b = s.find_first_not_of(kSpace);
    if (b == std::string_view::npos) return {};
    return s.substr(b, s.find_last_not_of(kSpace) - b + 1);
}

// Matches "--name value" and "--name=value"; advances i past a consumed value.
bool takeValue(int argc, char** argv, int& i, std::string_view name, std::string_view& out) {
    std::string_view a = argv[i] ? argv[i] : "";
    if (a.substr(0, name.size()) != name) return false;
    if (a.size() == name.size()) {
        if (i + 1 >= argc || !argv[i + 1]) return false;
        out = argv[++i];
        return true;
    }
    if (a[name.size()] != '=') return false;
    out = a.substr(name.size() + 1);
    return true;
}

} // namespace

spdlog::level::level_enum parse_log_level(std::string_view s, spdlog::level::level_enum fallback) {
    s = strip(s);
    for (const auto& [name, level] : kLevelNames) {
        if (name == s) return level;
    }
    return fallback;
}

LogInitConfig determine_log_config(int argc, char** argv, spdlog::level::level_enum default_level) {
    LogInitConfig cfg{};
    cfg.level = default_level;

    if (const char* env = std::getenv("VKBASE_LOG_LEVEL")) cfg.level = parse_log_level(env, cfg.level);
    if (const char* env = std::getenv("VKBASE_VALIDATION_LOG_LEVEL")) {
        cfg.validation_level = parse_log_level(env, cfg.validation_level);
    }
    if (const char* env = std::getenv("VKBASE_LOG_FILE"); env && env[0] != '\0') cfg.file_path = env;

    for (int i = 1; i < argc; ++i) {
        std::string_view value;
        if (takeValue(argc, argv, i, "--validation-log-level", value)) {
            cfg.validation_level = parse_log_level(value, cfg.validation_level);
        } else if (takeValue(argc, argv, i, "--log-level", value)) {
            cfg.level = parse_log_level(value, cfg.level);
        } else if (takeValue(argc, argv, i, "--log-file", value)) {
            cfg.file_path = std::string(value);
        } else if (argv[i] && std::string_view(argv[i]) == "--no-color") {
            cfg.use_color = false;
        }
    }
    return cfg;
}

void init_logging(const LogInitConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.use_color) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    std::string fileError;
    if (!cfg.file_path.empty()) {
        constexpr std::size_t kMaxBytes = 4 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 2;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file_path, kMaxBytes, kMaxFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    spdlog::drop(kValidationLogger);
    auto appLogger = std::make_shared<spdlog::logger>(kDefaultLogger, sinks.begin(), sinks.end());
    auto validation = std::make_shared<spdlog::logger>(kValidationLogger, sinks.begin(), sinks.end());
    appLogger->set_level(cfg.level);
    validation->set_level(cfg.validation_level);
    appLogger->flush_on(spdlog::level::warn);
    validation->flush_on(spdlog::level::err);

    spdlog::set_default_logger(appLogger);
    spdlog::register_logger(validation);
    // %n tells the application's lines apart from driver-reported ones.
    spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::flush_every(std::chrono::seconds(1));

    if (!fileError.empty()) {
        spdlog::warn("Cannot open log file '{}' ({}); console only", cfg.file_path, fileError);
    }
    spdlog::info("Logging: level={} validation={} file={}",
                 spdlog::level::to_string_view(cfg.level),
                 spdlog::level::to_string_view(cfg.validation_level),
                 (cfg.file_path.empty() || !fileError.empty()) ? std::string("none") : cfg.file_path);
}

std::shared_ptr<spdlog::logger> validation_logger() {
    if (auto logger = spdlog::get(kValidationLogger)) return logger;
    return spdlog::default_logger();
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace core
