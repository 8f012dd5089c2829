#include "FakeDriver.h"

#include <algorithm>

namespace fake {

namespace {

Driver g_driver;

template <typename H>
H makeHandle(uint64_t value) {
    return reinterpret_cast<H>(static_cast<uintptr_t>(value));
}

template <typename H>
uint64_t key(H handle) {
    return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(handle));
}

uint64_t newHandle() { return g_driver.nextHandle++; }

VkResult popResult(std::deque<VkResult>& q) {
    if (q.empty()) return VK_SUCCESS;
    VkResult r = q.front();
    q.pop_front();
    return r;
}

template <typename T>
VkResult enumerate(const std::vector<T>& src, uint32_t* count, T* out) {
    if (!out) {
        *count = static_cast<uint32_t>(src.size());
        return VK_SUCCESS;
    }
    const uint32_t n = std::min<uint32_t>(*count, static_cast<uint32_t>(src.size()));
    std::copy(src.begin(), src.begin() + n, out);
    *count = n;
    return n < src.size() ? VK_INCOMPLETE : VK_SUCCESS;
}

// surface

VKAPI_ATTR VkResult VKAPI_CALL getSurfaceCaps(VkPhysicalDevice, VkSurfaceKHR, VkSurfaceCapabilitiesKHR* caps) {
    if (g_driver.capsResult != VK_SUCCESS) return g_driver.capsResult;
    *caps = g_driver.caps;
    return VK_SUCCESS;
}

VKAPI_ATTR VkResult VKAPI_CALL getSurfaceFormats(VkPhysicalDevice, VkSurfaceKHR, uint32_t* count, VkSurfaceFormatKHR* out) {
    return enumerate(g_driver.formats, count, out);
}

VKAPI_ATTR VkResult VKAPI_CALL getPresentModes(VkPhysicalDevice, VkSurfaceKHR, uint32_t* count, VkPresentModeKHR* out) {
    return enumerate(g_driver.presentModes, count, out);
}

VKAPI_ATTR void VKAPI_CALL getFormatProperties(VkPhysicalDevice, VkFormat format, VkFormatProperties* props) {
    *props = VkFormatProperties{};
    auto it = g_driver.formatFeatures.find(format);
    props->optimalTilingFeatures = it != g_driver.formatFeatures.end() ? it->second : g_driver.defaultFeatures;
}

// swapchain

VKAPI_ATTR VkResult VKAPI_CALL createSwapchain(VkDevice, const VkSwapchainCreateInfoKHR* info,
                                               const VkAllocationCallbacks*, VkSwapchainKHR* out) {
    // oldSwapchain is retired even when creation fails.
    g_driver.lastSwapchainInfo = *info;
    g_driver.lastOldSwapchain = info->oldSwapchain;
    VkResult r = popResult(g_driver.createSwapchainResults);
    if (r != VK_SUCCESS) return r;
    *out = makeHandle<VkSwapchainKHR>(newHandle());
    ++g_driver.swapchainsCreated;
    ++g_driver.liveSwapchains;
    g_driver.nextImage = 0;
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroySwapchain(VkDevice, VkSwapchainKHR sc, const VkAllocationCallbacks*) {
    if (sc) --g_driver.liveSwapchains;
}

VKAPI_ATTR VkResult VKAPI_CALL getSwapchainImages(VkDevice, VkSwapchainKHR, uint32_t* count, VkImage* out) {
    std::vector<VkImage> images;
    for (uint32_t i = 0; i < g_driver.swapchainImageCount; ++i) {
        images.push_back(makeHandle<VkImage>(0x10000 + i));
    }
    return enumerate(images, count, out);
}

VKAPI_ATTR VkResult VKAPI_CALL createImageView(VkDevice, const VkImageViewCreateInfo*,
                                               const VkAllocationCallbacks*, VkImageView* out) {
    *out = makeHandle<VkImageView>(newHandle());
    ++g_driver.liveViews;
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroyImageView(VkDevice, VkImageView view, const VkAllocationCallbacks*) {
    if (view) --g_driver.liveViews;
}

VKAPI_ATTR VkResult VKAPI_CALL acquireNextImage(VkDevice, VkSwapchainKHR, uint64_t, VkSemaphore,
                                                VkFence, uint32_t* index) {
    ++g_driver.acquireCalls;
    VkResult r = popResult(g_driver.acquireResults);
    if (r == VK_SUCCESS || r == VK_SUBOPTIMAL_KHR) {
        *index = g_driver.nextImage++ % std::max(1u, g_driver.swapchainImageCount);
    }
    return r;
}

VKAPI_ATTR VkResult VKAPI_CALL queuePresent(VkQueue, const VkPresentInfoKHR*) {
    ++g_driver.presentCalls;
    return popResult(g_driver.presentResults);
}

// sync objects

VKAPI_ATTR VkResult VKAPI_CALL createFence(VkDevice, const VkFenceCreateInfo* info,
                                           const VkAllocationCallbacks*, VkFence* out) {
    const uint64_t h = newHandle();
    FenceState st;
    st.signaled = (info->flags & VK_FENCE_CREATE_SIGNALED_BIT) != 0;
    g_driver.fences[h] = st;
    ++g_driver.liveFences;
    *out = makeHandle<VkFence>(h);
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroyFence(VkDevice, VkFence fence, const VkAllocationCallbacks*) {
    if (!fence) return;
    g_driver.fences.erase(key(fence));
    --g_driver.liveFences;
}

VKAPI_ATTR VkResult VKAPI_CALL resetFences(VkDevice, uint32_t count, const VkFence* fences) {
    for (uint32_t i = 0; i < count; ++i) {
        FenceState& st = g_driver.fences[key(fences[i])];
        if (st.pending) ++g_driver.resetWhilePending;
        st.signaled = false;
    }
    return VK_SUCCESS;
}

VKAPI_ATTR VkResult VKAPI_CALL waitForFences(VkDevice, uint32_t count, const VkFence* fences, VkBool32, uint64_t) {
    ++g_driver.waitCalls;
    VkResult r = popResult(g_driver.waitResults);
    for (uint32_t i = 0; i < count; ++i) g_driver.waitedFences.push_back(fences[i]);
    if (r != VK_SUCCESS) return r;
    for (uint32_t i = 0; i < count; ++i) {
        FenceState& st = g_driver.fences[key(fences[i])];
        if (st.pending) {
            st.pending = false;
            st.signaled = true;
        } else if (!st.signaled) {
            ++g_driver.waitOnUnsubmitted;
        }
    }
    return VK_SUCCESS;
}

VKAPI_ATTR VkResult VKAPI_CALL createSemaphore(VkDevice, const VkSemaphoreCreateInfo*,
                                               const VkAllocationCallbacks*, VkSemaphore* out) {
    *out = makeHandle<VkSemaphore>(newHandle());
    ++g_driver.liveSemaphores;
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroySemaphore(VkDevice, VkSemaphore sem, const VkAllocationCallbacks*) {
    if (sem) --g_driver.liveSemaphores;
}

// command recording

VKAPI_ATTR VkResult VKAPI_CALL createCommandPool(VkDevice, const VkCommandPoolCreateInfo*,
                                                 const VkAllocationCallbacks*, VkCommandPool* out) {
    *out = makeHandle<VkCommandPool>(newHandle());
    ++g_driver.livePools;
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroyCommandPool(VkDevice, VkCommandPool pool, const VkAllocationCallbacks*) {
    if (pool) --g_driver.livePools;
}

VKAPI_ATTR VkResult VKAPI_CALL resetCommandPool(VkDevice, VkCommandPool, VkCommandPoolResetFlags) {
    return VK_SUCCESS;
}

VKAPI_ATTR VkResult VKAPI_CALL allocateCommandBuffers(VkDevice, const VkCommandBufferAllocateInfo* info,
                                                      VkCommandBuffer* out) {
    for (uint32_t i = 0; i < info->commandBufferCount; ++i) {
        out[i] = makeHandle<VkCommandBuffer>(newHandle());
    }
    return VK_SUCCESS;
}

bool commandBufferPending(VkCommandBuffer cmd) {
    auto it = g_driver.cmdFence.find(key(cmd));
    if (it == g_driver.cmdFence.end()) return false;
    auto f = g_driver.fences.find(it->second);
    return f != g_driver.fences.end() && f->second.pending;
}

VKAPI_ATTR VkResult VKAPI_CALL beginCommandBuffer(VkCommandBuffer cmd, const VkCommandBufferBeginInfo*) {
    if (commandBufferPending(cmd)) ++g_driver.recordWhilePending;
    return VK_SUCCESS;
}

VKAPI_ATTR VkResult VKAPI_CALL endCommandBuffer(VkCommandBuffer) { return VK_SUCCESS; }

VKAPI_ATTR VkResult VKAPI_CALL queueSubmit2(VkQueue, uint32_t count, const VkSubmitInfo2* submits, VkFence fence) {
    ++g_driver.submitCalls;
    VkResult r = popResult(g_driver.submitResults);
    if (r != VK_SUCCESS) return r;
    for (uint32_t i = 0; i < count; ++i) {
        for (uint32_t c = 0; c < submits[i].commandBufferInfoCount; ++c) {
            VkCommandBuffer cmd = submits[i].pCommandBufferInfos[c].commandBuffer;
            if (commandBufferPending(cmd)) ++g_driver.submitWhilePending;
            if (fence) g_driver.cmdFence[key(cmd)] = key(fence);
        }
    }
    if (fence) {
        FenceState& st = g_driver.fences[key(fence)];
        if (st.signaled) ++g_driver.submitWithSignaledFence;
        if (st.pending) ++g_driver.submitWhilePending;
        st.signaled = false;
        st.pending = true;
    }
    g_driver.maxPending = std::max(g_driver.maxPending, g_driver.pendingCount());
    return VK_SUCCESS;
}

// timestamps

VKAPI_ATTR VkResult VKAPI_CALL createQueryPool(VkDevice, const VkQueryPoolCreateInfo*,
                                               const VkAllocationCallbacks*, VkQueryPool* out) {
    *out = makeHandle<VkQueryPool>(newHandle());
    ++g_driver.liveQueryPools;
    return VK_SUCCESS;
}

VKAPI_ATTR void VKAPI_CALL destroyQueryPool(VkDevice, VkQueryPool pool, const VkAllocationCallbacks*) {
    if (pool) --g_driver.liveQueryPools;
}

VKAPI_ATTR void VKAPI_CALL cmdResetQueryPool(VkCommandBuffer, VkQueryPool, uint32_t, uint32_t) {}

VKAPI_ATTR void VKAPI_CALL cmdWriteTimestamp2(VkCommandBuffer, VkPipelineStageFlags2, VkQueryPool, uint32_t) {}

// Every frame reports 2000 ticks between its two timestamps.
VKAPI_ATTR VkResult VKAPI_CALL getQueryPoolResults(VkDevice, VkQueryPool, uint32_t, uint32_t count, size_t,
                                                   void* data, VkDeviceSize, VkQueryResultFlags) {
    auto* ticks = static_cast<uint64_t*>(data);
    for (uint32_t i = 0; i < count; ++i) ticks[i] = 1000 + 2000ull * i;
    return VK_SUCCESS;
}

} // namespace

uint32_t Driver::pendingCount() const {
    uint32_t n = 0;
    for (const auto& kv : fences) {
        if (kv.second.pending) ++n;
    }
    return n;
}

Driver& driver() { return g_driver; }

Driver& install() {
    g_driver = Driver{};
    Driver& d = g_driver;
    d.caps.minImageCount = 2;
    d.caps.maxImageCount = 8;
    d.caps.currentExtent = VkExtent2D{UINT32_MAX, UINT32_MAX};
    d.caps.minImageExtent = VkExtent2D{1, 1};
    d.caps.maxImageExtent = VkExtent2D{4096, 4096};
    d.caps.maxImageArrayLayers = 1;
    d.caps.supportedTransforms = VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR;
    d.caps.currentTransform = VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR;
    d.caps.supportedCompositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    d.caps.supportedUsageFlags = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT |
                                 VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    d.formats = {
        VkSurfaceFormatKHR{VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        VkSurfaceFormatKHR{VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
    };
    d.presentModes = {VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_MAILBOX_KHR};
    d.defaultFeatures = VK_FORMAT_FEATURE_COLOR_ATTACHMENT_BIT | VK_FORMAT_FEATURE_TRANSFER_DST_BIT |
                        VK_FORMAT_FEATURE_BLIT_DST_BIT;

    vkGetPhysicalDeviceSurfaceCapabilitiesKHR = getSurfaceCaps;
    vkGetPhysicalDeviceSurfaceFormatsKHR = getSurfaceFormats;
    vkGetPhysicalDeviceSurfacePresentModesKHR = getPresentModes;
    vkGetPhysicalDeviceFormatProperties = getFormatProperties;
    vkCreateSwapchainKHR = createSwapchain;
    vkDestroySwapchainKHR = destroySwapchain;
    vkGetSwapchainImagesKHR = getSwapchainImages;
    vkCreateImageView = createImageView;
    vkDestroyImageView = destroyImageView;
    vkAcquireNextImageKHR = acquireNextImage;
    vkQueuePresentKHR = queuePresent;
    vkCreateFence = createFence;
    vkDestroyFence = destroyFence;
    vkResetFences = resetFences;
    vkWaitForFences = waitForFences;
    vkCreateSemaphore = createSemaphore;
    vkDestroySemaphore = destroySemaphore;
    vkCreateCommandPool = createCommandPool;
    vkDestroyCommandPool = destroyCommandPool;
    vkResetCommandPool = resetCommandPool;
    vkAllocateCommandBuffers = allocateCommandBuffers;
    vkBeginCommandBuffer = beginCommandBuffer;
    vkEndCommandBuffer = endCommandBuffer;
    vkQueueSubmit2 = queueSubmit2;
    vkCreateQueryPool = createQueryPool;
    vkDestroyQueryPool = destroyQueryPool;
    vkCmdResetQueryPool = cmdResetQueryPool;
    vkCmdWriteTimestamp2 = cmdWriteTimestamp2;
    vkGetQueryPoolResults = getQueryPoolResults;
    return d;
}

VkDevice device() { return makeHandle<VkDevice>(0x1); }
VkPhysicalDevice physicalDevice() { return makeHandle<VkPhysicalDevice>(0x2); }
VkSurfaceKHR surface() { return makeHandle<VkSurfaceKHR>(0x3); }
VkQueue queue() { return makeHandle<VkQueue>(0x4); }

} // namespace fake
