#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "core/Logging.h"

namespace core {

// Frame slots live in a fixed-capacity array sized by kMaxFramesInFlight.
constexpr uint32_t kMinFramesInFlight = 2;
constexpr uint32_t kMaxFramesInFlight = 3;

#ifdef NDEBUG
constexpr bool kDebugBuild = false;
#else
constexpr bool kDebugBuild = true;
#endif

struct RuntimeConfig {
    uint32_t framesInFlight = kMinFramesInFlight;
    bool enableValidation = kDebugBuild;
    bool lifetimeChecks = kDebugBuild;
    bool preferVsync = true;
    bool gpuTiming = true;
    uint64_t fenceTimeoutNs = UINT64_MAX; // no limit: a stuck fence means a lost device
    uint32_t maxConsecutiveRebuilds = 3;
    LogInitConfig log{};
};

// "1|0|on|off|true|false|yes|no" (case-sensitive). nullopt when unrecognized.
std::optional<bool> parse_bool(std::string_view s);

// Clamp a requested frames-in-flight count into [kMinFramesInFlight, kMaxFramesInFlight].
uint32_t clamp_frames_in_flight(long requested);

// Layer env and CLI on top of `defaults` (which an example may have tuned).
// Env vars:
//   VKBASE_FRAMES_IN_FLIGHT, VKBASE_VALIDATION, VKBASE_LIFETIME_CHECKS
// CLI flags (override env):
//   --frames-in-flight <n> | --frames-in-flight=<n>
//   --validation | --no-validation
//   --lifetime-checks | --no-lifetime-checks
//   --no-vsync, --no-gpu-timing
//   --fence-timeout-ms <ms>
// Log flags are forwarded to determine_log_config.
RuntimeConfig determine_runtime_config(int argc, char** argv, const RuntimeConfig& defaults = {});

// One-line summary for the startup log.
void log_runtime_config(const RuntimeConfig& cfg);

} // namespace core
