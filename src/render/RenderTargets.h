#pragma once

#include <array>
#include <cstdint>

#include <volk.h>

#include "core/Config.h"
#include "core/GpuAllocator.h"

namespace platform { class VulkanContext; }
namespace core { class UploadContext; }

namespace render {

// One storage output image per frame slot, kept in GENERAL between frames and
// copied into the acquired swapchain image at the end of each frame.
class RenderTargets {
public:
    static constexpr VkFormat kFormat = VK_FORMAT_R8G8B8A8_UNORM;

    bool init(platform::VulkanContext& vk, core::UploadContext& upload, uint32_t slots, VkExtent2D extent);
    // Caller drains in-flight frames first.
    bool resize(VkExtent2D extent);
    void shutdown();

    VkExtent2D extent() const { return extent_; }
    uint32_t count() const { return count_; }
    const core::AllocatedImage& target(uint32_t slot) const { return images_[slot]; }

    // Leaves the storage image in GENERAL and the swapchain image in COLOR_ATTACHMENT_OPTIMAL.
    void recordCopyToSwapchain(VkCommandBuffer cmd, uint32_t slot, VkImage swapchainImage, VkExtent2D swapchainExtent) const;
    static void recordPresentTransition(VkCommandBuffer cmd, VkImage swapchainImage);

private:
    bool createImages(VkExtent2D extent);
    bool destroyImages();

    platform::VulkanContext* vk_ = nullptr;
    core::UploadContext* upload_ = nullptr;
    std::array<core::AllocatedImage, core::kMaxFramesInFlight> images_{};
    uint32_t count_ = 0;
    VkExtent2D extent_{};
};

} // namespace render
