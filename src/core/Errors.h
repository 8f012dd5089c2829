#pragma once

#include <cstdint>
#include <string_view>

#include <volk.h>

namespace core {

// Failure of a buffer/image request. Fatal to the requesting operation; the
// caller decides whether to shrink the request or abort.
enum class AllocationError : uint8_t {
    None = 0,
    InvalidRequest,     // zero size/extent, unknown format, allocator not ready
    OutOfDeviceMemory,
    OutOfHostMemory,
    Fragmentation,
    DeviceFailure
};

// Acceleration-structure build failures are deterministic for a given input.
enum class BuildError : uint8_t {
    None = 0,
    EmptyInput,
    SizeMismatch,
    StaleReference,     // instance names a BLAS that is no longer registered
    AllocationFailed,
    DeviceFailure,
    Unsupported         // builder not initialized or device lacks ray tracing
};

// Result of acquire/present/rebuild. OutOfDate is routine and recovered by
// rebuilding; Fatal terminates the example.
enum class SwapchainStatus : uint8_t {
    Ok = 0,
    OutOfDate,
    Fatal
};

enum class SyncError : uint8_t {
    None = 0,
    DeviceLost,
    SubmitFailed,
    Timeout
};

std::string_view to_string(AllocationError e);
std::string_view to_string(BuildError e);
std::string_view to_string(SwapchainStatus s);
std::string_view to_string(SyncError e);

// Map a VkResult coming back from VMA/vkCreate* into the allocation taxonomy.
AllocationError classify_allocation(VkResult result);

// Map a fence/submit failure. VK_TIMEOUT is reported separately because the
// frame loop treats a timed-out fence as a lost device.
SyncError classify_sync(VkResult result);

} // namespace core
