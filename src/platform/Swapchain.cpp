#include "Swapchain.h"
#include <vector>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace platform {

namespace {

// The render target is blitted in, so BLIT_DST as well as TRANSFER_DST.
constexpr VkFormatFeatureFlags kRequiredFormatFeatures =
    VK_FORMAT_FEATURE_COLOR_ATTACHMENT_BIT | VK_FORMAT_FEATURE_TRANSFER_DST_BIT | VK_FORMAT_FEATURE_BLIT_DST_BIT;

bool supportsTargetUsage(VkPhysicalDevice phys, VkFormat fmt) {
    VkFormatProperties props{};
    vkGetPhysicalDeviceFormatProperties(phys, fmt, &props);
    return (props.optimalTilingFeatures & kRequiredFormatFeatures) == kRequiredFormatFeatures;
}

bool selectSurfaceFormat(VkPhysicalDevice phys,
                         const std::vector<VkSurfaceFormatKHR>& fmts,
                         VkFormat preferred,
                         VkSurfaceFormatKHR& chosen) {
    const VkColorSpaceKHR desiredCS = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;

    // A single UNDEFINED entry means the surface takes any format.
    if (fmts.size() == 1 && fmts[0].format == VK_FORMAT_UNDEFINED) {
        const VkFormat candidates[] = {
            preferred,
            VK_FORMAT_B8G8R8A8_UNORM,
            VK_FORMAT_R8G8B8A8_UNORM
        };
        for (VkFormat fmt : candidates) {
            if (fmt == VK_FORMAT_UNDEFINED || !supportsTargetUsage(phys, fmt)) continue;
            chosen.format = fmt;
            chosen.colorSpace = fmts[0].colorSpace;
            return true;
        }
        return false;
    }

    auto tryPick = [&](VkFormat fmt, bool requireColorSpace) -> bool {
        for (auto& f : fmts) {
            if (f.format != fmt) continue;
            if (requireColorSpace && f.colorSpace != desiredCS) continue;
            if (!supportsTargetUsage(phys, f.format)) continue;
            chosen = f;
            return true;
        }
        return false;
    };

    // An explicitly requested format (e.g. HDR) keeps whatever colour space the surface pairs it with.
    if (preferred != VK_FORMAT_UNDEFINED && tryPick(preferred, false)) return true;
    if (tryPick(VK_FORMAT_B8G8R8A8_UNORM, true)) return true;
    if (tryPick(VK_FORMAT_R8G8B8A8_UNORM, true)) return true;
    if (tryPick(VK_FORMAT_B8G8R8A8_UNORM, false)) return true;
    if (tryPick(VK_FORMAT_R8G8B8A8_UNORM, false)) return true;

    for (auto& f : fmts) {
        if (!supportsTargetUsage(phys, f.format)) continue;
        chosen = f;
        return true;
    }
    return false;
}

VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync) {
    if (vsync) return VK_PRESENT_MODE_FIFO_KHR;
    for (auto m : modes) if (m == VK_PRESENT_MODE_MAILBOX_KHR) return m;
    for (auto m : modes) if (m == VK_PRESENT_MODE_IMMEDIATE_KHR) return m;
    return VK_PRESENT_MODE_FIFO_KHR;
}

} // namespace

const char* to_string(SwapchainState s) {
    switch (s) {
        case SwapchainState::Valid: return "valid";
        case SwapchainState::OutOfDate: return "out-of-date";
        case SwapchainState::Destroyed: return "destroyed";
    }
    return "unknown";
}

core::SwapchainStatus Swapchain::create(const SwapchainCreateInfo& info) {
    if (!info.device || !info.surface || !info.physicalDevice) {
        spdlog::error("Swapchain::create requires device, surface and physical device");
        return core::SwapchainStatus::Fatal;
    }
    info_ = info;
    return build(info.width, info.height);
}

core::SwapchainStatus Swapchain::rebuild(uint32_t width, uint32_t height) {
    if (!info_.device) {
        spdlog::error("Swapchain::rebuild called before create");
        return core::SwapchainStatus::Fatal;
    }
    core::SwapchainStatus st = build(width, height);
    if (st == core::SwapchainStatus::Ok) {
        ++rebuildCount_;
        spdlog::info("Swapchain rebuilt: {}x{} images={} (rebuild #{})",
                     extent_.width, extent_.height, imageCount(), rebuildCount_);
    }
    return st;
}

core::SwapchainStatus Swapchain::build(uint32_t width, uint32_t height) {
    pendingWidth_ = width;
    pendingHeight_ = height;
    if (width == 0 || height == 0) {
        spdlog::debug("Swapchain build skipped for zero-area surface ({}x{})", width, height);
        state_ = SwapchainState::OutOfDate;
        return core::SwapchainStatus::OutOfDate;
    }

    VkSurfaceCapabilitiesKHR caps{};
    VkResult res = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(info_.physicalDevice, info_.surface, &caps);
    if (res != VK_SUCCESS) {
        spdlog::error("vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed ({})", static_cast<int>(res));
        return core::SwapchainStatus::Fatal;
    }
    if ((caps.supportedUsageFlags & kRequiredUsage) != kRequiredUsage) {
        spdlog::error("Surface does not support color-attachment + transfer-dst images (usage=0x{:x})",
                      static_cast<uint32_t>(caps.supportedUsageFlags));
        return core::SwapchainStatus::Fatal;
    }

    uint32_t fmtCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(info_.physicalDevice, info_.surface, &fmtCount, nullptr);
    std::vector<VkSurfaceFormatKHR> fmts(fmtCount);
    if (fmtCount > 0) {
        vkGetPhysicalDeviceSurfaceFormatsKHR(info_.physicalDevice, info_.surface, &fmtCount, fmts.data());
        fmts.resize(fmtCount);
    }
    uint32_t pmCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(info_.physicalDevice, info_.surface, &pmCount, nullptr);
    std::vector<VkPresentModeKHR> pms(pmCount);
    if (pmCount > 0) {
        vkGetPhysicalDeviceSurfacePresentModesKHR(info_.physicalDevice, info_.surface, &pmCount, pms.data());
        pms.resize(pmCount);
    }

    if (fmts.empty()) {
        spdlog::error("No surface formats reported by the driver.");
        return core::SwapchainStatus::Fatal;
    }
    VkSurfaceFormatKHR fmt{};
    if (!selectSurfaceFormat(info_.physicalDevice, fmts, info_.preferredFormat, fmt)) {
        spdlog::error("No surface format supports color-attachment + transfer-dst; cannot build swapchain.");
        return core::SwapchainStatus::Fatal;
    }
    VkPresentModeKHR pmode = choosePresentMode(pms, info_.vsync);

    VkExtent2D extent{};
    if (caps.currentExtent.width != UINT32_MAX) {
        extent = caps.currentExtent;
    } else {
        extent.width = std::clamp<uint32_t>(width, caps.minImageExtent.width, caps.maxImageExtent.width);
        extent.height = std::clamp<uint32_t>(height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }
    if (extent.width == 0 || extent.height == 0) {
        spdlog::debug("Surface reports zero extent; swapchain stays out of date");
        state_ = SwapchainState::OutOfDate;
        return core::SwapchainStatus::OutOfDate;
    }
    uint32_t minImages = caps.minImageCount + 1;
    if (caps.maxImageCount > 0 && minImages > caps.maxImageCount) minImages = caps.maxImageCount;

    VkSwapchainCreateInfoKHR sci{VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR};
    sci.surface = info_.surface;
    sci.minImageCount = minImages;
    sci.imageFormat = fmt.format;
    sci.imageColorSpace = fmt.colorSpace;
    sci.imageExtent = extent;
    sci.imageArrayLayers = 1;
    sci.imageUsage = kRequiredUsage;
    uint32_t indices[2] = { info_.graphicsQueueFamily, info_.presentQueueFamily };
    if (info_.graphicsQueueFamily != info_.presentQueueFamily) {
        sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        sci.queueFamilyIndexCount = 2; sci.pQueueFamilyIndices = indices;
    } else {
        sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }
    sci.preTransform = caps.currentTransform;
    sci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    sci.presentMode = pmode;
    sci.clipped = VK_TRUE;
    sci.oldSwapchain = swapchain_;

    VkSwapchainKHR next = VK_NULL_HANDLE;
    res = vkCreateSwapchainKHR(info_.device, &sci, nullptr, &next);

    // oldSwapchain is retired whether or not creation succeeded, so it can
    // never be passed again. Callers drain before rebuilding.
    destroyViews();
    if (swapchain_) vkDestroySwapchainKHR(info_.device, swapchain_, nullptr);
    swapchain_ = VK_NULL_HANDLE;

    if (res == VK_ERROR_OUT_OF_DATE_KHR) {
        spdlog::warn("Surface changed again while rebuilding the swapchain");
        state_ = SwapchainState::OutOfDate;
        return core::SwapchainStatus::OutOfDate;
    }
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateSwapchainKHR failed ({})", static_cast<int>(res));
        state_ = SwapchainState::OutOfDate;
        return core::SwapchainStatus::Fatal;
    }
    swapchain_ = next;
    format_ = fmt.format;
    colorSpace_ = fmt.colorSpace;
    presentMode_ = pmode;
    extent_ = extent;

    uint32_t count = 0;
    vkGetSwapchainImagesKHR(info_.device, swapchain_, &count, nullptr);
    images_.resize(count);
    vkGetSwapchainImagesKHR(info_.device, swapchain_, &count, images_.data());
    images_.resize(count);
    views_.assign(count, VK_NULL_HANDLE);
    for (uint32_t i = 0; i < count; ++i) {
        VkImageViewCreateInfo vci{VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
        vci.image = images_[i];
        vci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        vci.format = fmt.format;
        vci.components = { VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY };
        vci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.levelCount = 1; vci.subresourceRange.layerCount = 1;
        res = vkCreateImageView(info_.device, &vci, nullptr, &views_[i]);
        if (res != VK_SUCCESS) {
            spdlog::error("vkCreateImageView failed for swapchain image {} ({})", i, static_cast<int>(res));
            views_[i] = VK_NULL_HANDLE;
            return core::SwapchainStatus::Fatal;
        }
    }

    state_ = SwapchainState::Valid;
    suboptimal_ = false;
    spdlog::debug("Swapchain {}x{} fmt={} present={} images={}", extent_.width, extent_.height,
                  static_cast<int>(format_), static_cast<int>(presentMode_), count);
    return core::SwapchainStatus::Ok;
}

void Swapchain::destroyViews() {
    for (VkImageView v : views_) {
        if (v) vkDestroyImageView(info_.device, v, nullptr);
    }
    views_.clear();
    images_.clear();
}

void Swapchain::destroy() {
    if (info_.device) {
        destroyViews();
        if (swapchain_) { vkDestroySwapchainKHR(info_.device, swapchain_, nullptr); }
    }
    swapchain_ = VK_NULL_HANDLE;
    state_ = SwapchainState::Destroyed;
    suboptimal_ = false;
}

core::SwapchainStatus Swapchain::acquireNextImage(VkSemaphore signalSemaphore, uint32_t& imageIndex) {
    if (state_ == SwapchainState::OutOfDate) return core::SwapchainStatus::OutOfDate;
    if (state_ == SwapchainState::Destroyed || !swapchain_) {
        spdlog::error("acquireNextImage on a destroyed swapchain");
        return core::SwapchainStatus::Fatal;
    }
    VkResult res = vkAcquireNextImageKHR(info_.device, swapchain_, UINT64_MAX, signalSemaphore, VK_NULL_HANDLE, &imageIndex);
    switch (res) {
        case VK_SUCCESS:
            return core::SwapchainStatus::Ok;
        case VK_SUBOPTIMAL_KHR:
            // The semaphore will still be signaled, so the image has to be used;
            // the following present reports OutOfDate.
            spdlog::debug("Acquire returned suboptimal; rebuilding after present");
            suboptimal_ = true;
            return core::SwapchainStatus::Ok;
        case VK_ERROR_OUT_OF_DATE_KHR:
            spdlog::warn("Swapchain out of date on acquire");
            state_ = SwapchainState::OutOfDate;
            return core::SwapchainStatus::OutOfDate;
        default:
            spdlog::error("vkAcquireNextImageKHR failed ({})", static_cast<int>(res));
            return core::SwapchainStatus::Fatal;
    }
}

core::SwapchainStatus Swapchain::present(VkQueue queue, uint32_t imageIndex, VkSemaphore waitSemaphore) {
    if (state_ == SwapchainState::Destroyed || !swapchain_) {
        spdlog::error("present on a destroyed swapchain");
        return core::SwapchainStatus::Fatal;
    }
    VkPresentInfoKHR pi{VK_STRUCTURE_TYPE_PRESENT_INFO_KHR};
    pi.waitSemaphoreCount = waitSemaphore ? 1u : 0u;
    pi.pWaitSemaphores = waitSemaphore ? &waitSemaphore : nullptr;
    pi.swapchainCount = 1;
    pi.pSwapchains = &swapchain_;
    pi.pImageIndices = &imageIndex;

    VkResult res = vkQueuePresentKHR(queue, &pi);
    if (res == VK_SUCCESS && !suboptimal_ && state_ == SwapchainState::Valid) {
        return core::SwapchainStatus::Ok;
    }
    if (res == VK_SUCCESS || res == VK_SUBOPTIMAL_KHR || res == VK_ERROR_OUT_OF_DATE_KHR) {
        if (res != VK_SUCCESS) spdlog::warn("Swapchain {} on present", res == VK_SUBOPTIMAL_KHR ? "suboptimal" : "out of date");
        state_ = SwapchainState::OutOfDate;
        suboptimal_ = false;
        return core::SwapchainStatus::OutOfDate;
    }
    spdlog::error("vkQueuePresentKHR failed ({})", static_cast<int>(res));
    return core::SwapchainStatus::Fatal;
}

void Swapchain::notifySurfaceResized(uint32_t width, uint32_t height) {
    pendingWidth_ = width;
    pendingHeight_ = height;
    if (state_ == SwapchainState::Valid && (width != extent_.width || height != extent_.height)) {
        spdlog::debug("Surface resized to {}x{}; swapchain marked out of date", width, height);
        state_ = SwapchainState::OutOfDate;
    }
}

} // namespace platform
