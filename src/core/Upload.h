#pragma once

#include <cstdint>
#include <functional>

#include <volk.h>

#include "core/Errors.h"
#include "core/GpuAllocator.h"

namespace platform { class VulkanContext; }

namespace core {

// Blocking one-shot submissions on the graphics queue, used for uploads,
// acceleration-structure builds and initial layout transitions. Each call
// returns only after the GPU finished, so nothing it touched is in flight
// afterwards. Not for per-frame work.
class UploadContext {
public:
    using RecordFn = std::function<void(VkCommandBuffer)>;

    // Uploads larger than `stagingBytes` are split into staging-sized chunks.
    bool init(platform::VulkanContext& vk, VkDeviceSize stagingBytes = 8 * 1024 * 1024);
    void shutdown();

    bool submitImmediate(const RecordFn& record);

    bool uploadBuffer(const void* data, VkDeviceSize bytes, VkBuffer dstBuffer, VkDeviceSize dstOffset = 0);
    // Device-local buffer filled from `data`; TRANSFER_DST is added to `usage`.
    AllocationError createDeviceBuffer(const void* data, VkDeviceSize bytes, VkBufferUsageFlags usage,
                                       AllocatedBuffer& out);

    bool valid() const { return vk_ != nullptr && cmd_ != VK_NULL_HANDLE; }
    // Once DeviceLost is seen every later submission is refused.
    SyncError lastError() const { return lastError_; }
    uint64_t submissions() const { return submissions_; }
    uint64_t bytesUploaded() const { return bytesUploaded_; }

private:
    bool fail(SyncError err, const char* what, VkResult res);
    bool waitFence(const char* when);

    platform::VulkanContext* vk_ = nullptr;
    VkQueue queue_ = VK_NULL_HANDLE;
    VkCommandPool pool_ = VK_NULL_HANDLE;
    VkCommandBuffer cmd_ = VK_NULL_HANDLE;
    VkFence fence_ = VK_NULL_HANDLE;
    AllocatedBuffer staging_{};
    SyncError lastError_ = SyncError::None;
    uint64_t submissions_ = 0;
    uint64_t bytesUploaded_ = 0;
};

}
