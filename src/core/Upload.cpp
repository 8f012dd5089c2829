#include "Upload.h"

#include <algorithm>
#include <cstring>

#include <spdlog/spdlog.h>

#include "platform/VulkanContext.h"

namespace core {

bool UploadContext::init(platform::VulkanContext& vk, VkDeviceSize stagingBytes) {
    shutdown();
    vk_ = &vk;
    queue_ = vk.graphicsQueue();
    VkDevice device = vk.device();

    VkCommandPoolCreateInfo poolInfo{VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
    poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    poolInfo.queueFamilyIndex = vk.graphicsFamily();
    VkResult res = vkCreateCommandPool(device, &poolInfo, nullptr, &pool_);
    if (res != VK_SUCCESS) return fail(SyncError::SubmitFailed, "vkCreateCommandPool", res);

    VkCommandBufferAllocateInfo allocInfo{VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    allocInfo.commandPool = pool_;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;
    res = vkAllocateCommandBuffers(device, &allocInfo, &cmd_);
    if (res != VK_SUCCESS) return fail(SyncError::SubmitFailed, "vkAllocateCommandBuffers", res);

    // Unsignaled: every submission waits on it before returning.
    VkFenceCreateInfo fenceInfo{VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
    res = vkCreateFence(device, &fenceInfo, nullptr, &fence_);
    if (res != VK_SUCCESS) return fail(SyncError::SubmitFailed, "vkCreateFence", res);

    const AllocationError err = vk.createBuffer(std::max<VkDeviceSize>(stagingBytes, 4096),
                                                VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                                staging_);
    if (err != AllocationError::None || !staging_.mapped) {
        spdlog::error("UploadContext: staging buffer unavailable: {}", to_string(err));
        return false;
    }
    return true;
}

bool UploadContext::fail(SyncError err, const char* what, VkResult res) {
    spdlog::error("UploadContext: {} failed ({})", what, static_cast<int>(res));
    if (lastError_ != SyncError::DeviceLost) lastError_ = err;
    return false;
}

bool UploadContext::submitImmediate(const RecordFn& record) {
    if (!valid()) {
        spdlog::error("UploadContext: submission before init");
        return false;
    }
    if (lastError_ == SyncError::DeviceLost) {
        spdlog::error("UploadContext: device lost, submission refused");
        return false;
    }
    VkDevice device = vk_->device();

    VkResult res = vkResetCommandPool(device, pool_, 0);
    if (res != VK_SUCCESS) return fail(classify_sync(res), "vkResetCommandPool", res);

    VkCommandBufferBeginInfo begin{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    res = vkBeginCommandBuffer(cmd_, &begin);
    if (res != VK_SUCCESS) return fail(SyncError::SubmitFailed, "vkBeginCommandBuffer", res);
    record(cmd_);
    res = vkEndCommandBuffer(cmd_);
    if (res != VK_SUCCESS) return fail(SyncError::SubmitFailed, "vkEndCommandBuffer", res);

    VkCommandBufferSubmitInfo cmdInfo{VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO};
    cmdInfo.commandBuffer = cmd_;
    VkSubmitInfo2 submit{VK_STRUCTURE_TYPE_SUBMIT_INFO_2};
    submit.commandBufferInfoCount = 1;
    submit.pCommandBufferInfos = &cmdInfo;
    res = vkQueueSubmit2(queue_, 1, &submit, fence_);
    if (res != VK_SUCCESS) return fail(classify_sync(res), "vkQueueSubmit2", res);
    ++submissions_;

    if (!waitFence("submission")) return false;
    res = vkResetFences(device, 1, &fence_);
    if (res != VK_SUCCESS) return fail(classify_sync(res), "vkResetFences", res);
    return true;
}

bool UploadContext::waitFence(const char* when) {
    const VkResult res = vkWaitForFences(vk_->device(), 1, &fence_, VK_TRUE, UINT64_MAX);
    if (res == VK_SUCCESS) return true;
    spdlog::error("UploadContext: fence wait after {} failed", when);
    return fail(classify_sync(res), "vkWaitForFences", res);
}

bool UploadContext::uploadBuffer(const void* data, VkDeviceSize bytes, VkBuffer dstBuffer, VkDeviceSize dstOffset) {
    if (bytes == 0) return true;
    if (!data || !dstBuffer) {
        spdlog::error("UploadContext::uploadBuffer: null source or destination");
        return false;
    }
    if (!valid()) return false;

    const auto* src = static_cast<const uint8_t*>(data);
    const VkDeviceSize chunk = staging_.size;
    for (VkDeviceSize done = 0; done < bytes; done += chunk) {
        const VkDeviceSize n = std::min(chunk, bytes - done);
        std::memcpy(staging_.mapped, src + done, static_cast<size_t>(n));
        const VkBufferCopy region{0, dstOffset + done, n};
        const VkBuffer stagingBuffer = staging_.buffer;
        if (!submitImmediate([&](VkCommandBuffer cmd) { vkCmdCopyBuffer(cmd, stagingBuffer, dstBuffer, 1, &region); })) {
            spdlog::error("UploadContext: copy of bytes [{}, {}) failed", done, done + n);
            return false;
        }
    }
    bytesUploaded_ += bytes;
    if (bytes > chunk) {
        spdlog::debug("UploadContext: {} bytes uploaded in {} chunks", bytes, (bytes + chunk - 1) / chunk);
    }
    return true;
}

AllocationError UploadContext::createDeviceBuffer(const void* data, VkDeviceSize bytes, VkBufferUsageFlags usage,
                                                  AllocatedBuffer& out) {
    if (!valid()) return AllocationError::InvalidRequest;
    const AllocationError err = vk_->createBuffer(bytes, usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                                                  VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, out);
    if (err != AllocationError::None) return err;
    if (data && !uploadBuffer(data, bytes, out.buffer)) {
        if (!vk_->destroy(out)) {
            spdlog::warn("UploadContext: buffer #{} kept after its upload failed", out.id);
        }
        return AllocationError::DeviceFailure;
    }
    return AllocationError::None;
}

void UploadContext::shutdown() {
    if (!vk_) return;
    if (staging_.valid() && !vk_->destroy(staging_)) {
        spdlog::warn("UploadContext: staging buffer release refused");
    }
    VkDevice device = vk_->device();
    if (fence_) vkDestroyFence(device, fence_, nullptr);
    if (pool_) vkDestroyCommandPool(device, pool_, nullptr);
    spdlog::debug("UploadContext: {} submissions, {} bytes uploaded", submissions_, bytesUploaded_);
    fence_ = VK_NULL_HANDLE;
    pool_ = VK_NULL_HANDLE;
    cmd_ = VK_NULL_HANDLE;
    queue_ = VK_NULL_HANDLE;
    vk_ = nullptr;
    lastError_ = SyncError::None;
    submissions_ = 0;
    bytesUploaded_ = 0;
}

}
