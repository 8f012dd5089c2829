#include "Errors.h"

namespace core {

std::string_view to_string(AllocationError e) {
    switch (e) {
        case AllocationError::None: return "none";
        case AllocationError::InvalidRequest: return "invalid-request";
        case AllocationError::OutOfDeviceMemory: return "out-of-device-memory";
        case AllocationError::OutOfHostMemory: return "out-of-host-memory";
        case AllocationError::Fragmentation: return "fragmentation";
        case AllocationError::DeviceFailure: return "device-failure";
    }
    return "unknown";
}

std::string_view to_string(BuildError e) {
    switch (e) {
        case BuildError::None: return "none";
        case BuildError::EmptyInput: return "empty-input";
        case BuildError::SizeMismatch: return "size-mismatch";
        case BuildError::StaleReference: return "stale-reference";
        case BuildError::AllocationFailed: return "allocation-failed";
        case BuildError::DeviceFailure: return "device-failure";
        case BuildError::Unsupported: return "unsupported";
    }
    return "unknown";
}

std::string_view to_string(SwapchainStatus s) {
    switch (s) {
        case SwapchainStatus::Ok: return "ok";
        case SwapchainStatus::OutOfDate: return "out-of-date";
        case SwapchainStatus::Fatal: return "fatal";
    }
    return "unknown";
}

std::string_view to_string(SyncError e) {
    switch (e) {
        case SyncError::None: return "none";
        case SyncError::DeviceLost: return "device-lost";
        case SyncError::SubmitFailed: return "submit-failed";
        case SyncError::Timeout: return "timeout";
    }
    return "unknown";
}

AllocationError classify_allocation(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return AllocationError::None;
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return AllocationError::OutOfDeviceMemory;
        case VK_ERROR_OUT_OF_HOST_MEMORY: return AllocationError::OutOfHostMemory;
        case VK_ERROR_FRAGMENTED_POOL:
        case VK_ERROR_FRAGMENTATION: return AllocationError::Fragmentation;
        case VK_ERROR_FEATURE_NOT_PRESENT:
        case VK_ERROR_FORMAT_NOT_SUPPORTED: return AllocationError::InvalidRequest;
        default: return AllocationError::DeviceFailure;
    }
}

SyncError classify_sync(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return SyncError::None;
        case VK_TIMEOUT: return SyncError::Timeout;
        case VK_ERROR_DEVICE_LOST: return SyncError::DeviceLost;
        default: return SyncError::SubmitFailed;
    }
}

} // namespace core
