#include "Config.h"

#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

namespace core {

namespace {

std::optional<long> parse_long(std::string_view s) {
    if (s.empty()) return std::nullopt;
    std::string tmp(s);
    char* end = nullptr;
    long v = std::strtol(tmp.c_str(), &end, 10);
    if (end == tmp.c_str() || *end != '\0') return std::nullopt;
    return v;
}

void apply_frames(RuntimeConfig& cfg, std::string_view value, const char* source) {
    auto n = parse_long(value);
    if (!n) {
        spdlog::warn("Ignoring frames-in-flight '{}' from {} (not a number)", value, source);
        return;
    }
    cfg.framesInFlight = clamp_frames_in_flight(*n);
}

void apply_toggle(bool& target, std::string_view value, const char* name) {
    if (auto b = parse_bool(value)) {
        target = *b;
    } else {
        spdlog::warn("Ignoring {}='{}' (expected 0/1/on/off/true/false)", name, value);
    }
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    if (s == "1" || s == "on" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "off" || s == "false" || s == "no") return false;
    return std::nullopt;
}

uint32_t clamp_frames_in_flight(long requested) {
    if (requested < static_cast<long>(kMinFramesInFlight)) {
        spdlog::warn("frames-in-flight {} below minimum, using {}", requested, kMinFramesInFlight);
        return kMinFramesInFlight;
    }
    if (requested > static_cast<long>(kMaxFramesInFlight)) {
        spdlog::warn("frames-in-flight {} above maximum, using {}", requested, kMaxFramesInFlight);
        return kMaxFramesInFlight;
    }
    return static_cast<uint32_t>(requested);
}

RuntimeConfig determine_runtime_config(int argc, char** argv, const RuntimeConfig& defaults) {
    RuntimeConfig cfg = defaults;
    cfg.log = determine_log_config(argc, argv, defaults.log.level);

    if (const char* env = std::getenv("VKBASE_FRAMES_IN_FLIGHT")) {
        apply_frames(cfg, env, "VKBASE_FRAMES_IN_FLIGHT");
    }
    if (const char* env = std::getenv("VKBASE_VALIDATION")) {
        apply_toggle(cfg.enableValidation, env, "VKBASE_VALIDATION");
    }
    if (const char* env = std::getenv("VKBASE_LIFETIME_CHECKS")) {
        apply_toggle(cfg.lifetimeChecks, env, "VKBASE_LIFETIME_CHECKS");
    }

    constexpr std::string_view kFramesEq = "--frames-in-flight=";
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i] ? argv[i] : "";
        if (a == "--frames-in-flight" && i + 1 < argc) {
            apply_frames(cfg, argv[++i], "--frames-in-flight");
        } else if (a.rfind(kFramesEq, 0) == 0) {
            apply_frames(cfg, a.substr(kFramesEq.size()), "--frames-in-flight");
        } else if (a == "--validation") {
            cfg.enableValidation = true;
        } else if (a == "--no-validation") {
            cfg.enableValidation = false;
        } else if (a == "--lifetime-checks") {
            cfg.lifetimeChecks = true;
        } else if (a == "--no-lifetime-checks") {
            cfg.lifetimeChecks = false;
        } else if (a == "--no-vsync") {
            cfg.preferVsync = false;
        } else if (a == "--no-gpu-timing") {
            cfg.gpuTiming = false;
        } else if (a == "--fence-timeout-ms" && i + 1 < argc) {
            auto ms = parse_long(argv[++i]);
            if (ms && *ms > 0) {
                cfg.fenceTimeoutNs = static_cast<uint64_t>(*ms) * 1'000'000ull;
            } else {
                spdlog::warn("Ignoring --fence-timeout-ms '{}'", argv[i]);
            }
        }
    }
    return cfg;
}

void log_runtime_config(const RuntimeConfig& cfg) {
    spdlog::info("Runtime config: framesInFlight={} validation={} lifetimeChecks={} vsync={} gpuTiming={} maxRebuilds={}",
                 cfg.framesInFlight, cfg.enableValidation, cfg.lifetimeChecks,
                 cfg.preferVsync, cfg.gpuTiming, cfg.maxConsecutiveRebuilds);
    if (cfg.fenceTimeoutNs != UINT64_MAX) {
        spdlog::info("Fence timeout: {} ms", cfg.fenceTimeoutNs / 1'000'000ull);
    }
}

} // namespace core
