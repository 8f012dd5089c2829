#pragma once

#include <cstdint>
#include <vector>
#include <volk.h>

#include "core/Errors.h"

namespace platform {

enum class SwapchainState : uint8_t { Valid, OutOfDate, Destroyed };

const char* to_string(SwapchainState s);

struct SwapchainCreateInfo {
    VkDevice device{};
    VkSurfaceKHR surface{};
    VkPhysicalDevice physicalDevice{};
    uint32_t graphicsQueueFamily = 0;
    uint32_t presentQueueFamily = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    VkFormat preferredFormat = VK_FORMAT_UNDEFINED; // tried first when the surface offers it
    bool vsync = true;
};

// Swapchain Manager. The swapchain never calls into the frame loop: every
// operation returns a status the caller acts on.
//
//   Valid --(acquire/present out-of-date or suboptimal, notifySurfaceResized)--> OutOfDate
//   OutOfDate --(rebuild)--> Valid
//   Valid/OutOfDate --(destroy)--> Destroyed
class Swapchain {
public:
    // Images must support these usages: the render target is blitted in, attachments may draw on top.
    static constexpr VkImageUsageFlags kRequiredUsage =
        VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;

    core::SwapchainStatus create(const SwapchainCreateInfo& info);
    // Recreate against current surface capabilities. A zero-area extent keeps the
    // chain OutOfDate without touching the device (caller skips the frame).
    core::SwapchainStatus rebuild(uint32_t width, uint32_t height);
    void destroy();

    core::SwapchainStatus acquireNextImage(VkSemaphore signalSemaphore, uint32_t& imageIndex);
    core::SwapchainStatus present(VkQueue queue, uint32_t imageIndex, VkSemaphore waitSemaphore);

    // Windowing collaborator reports a new framebuffer size.
    void notifySurfaceResized(uint32_t width, uint32_t height);

    SwapchainState state() const { return state_; }
    VkSwapchainKHR handle() const { return swapchain_; }
    uint32_t imageCount() const { return static_cast<uint32_t>(images_.size()); }
    VkFormat format() const { return format_; }
    VkColorSpaceKHR colorSpace() const { return colorSpace_; }
    VkPresentModeKHR presentMode() const { return presentMode_; }
    VkExtent2D extent() const { return extent_; }
    VkImage image(uint32_t i) const { return images_[i]; }
    VkImageView imageView(uint32_t i) const { return views_[i]; }
    uint32_t pendingWidth() const { return pendingWidth_; }
    uint32_t pendingHeight() const { return pendingHeight_; }
    uint32_t rebuildCount() const { return rebuildCount_; }

private:
    core::SwapchainStatus build(uint32_t width, uint32_t height);
    void destroyViews();

private:
    SwapchainCreateInfo info_{};
    VkSwapchainKHR swapchain_{};
    std::vector<VkImage> images_{};
    std::vector<VkImageView> views_{};
    VkFormat format_{VK_FORMAT_UNDEFINED};
    VkColorSpaceKHR colorSpace_{VK_COLOR_SPACE_SRGB_NONLINEAR_KHR};
    VkPresentModeKHR presentMode_{VK_PRESENT_MODE_FIFO_KHR};
    VkExtent2D extent_{};
    SwapchainState state_ = SwapchainState::Destroyed;
    bool suboptimal_ = false;
    uint32_t pendingWidth_ = 0;
    uint32_t pendingHeight_ = 0;
    uint32_t rebuildCount_ = 0;
};

} // namespace platform
