#pragma once

// Scripted stand-in for the Vulkan entry points used by the swapchain and
// frame controller. install() points the volk globals at it.

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

#include <volk.h>

namespace fake {

struct FenceState {
    bool signaled = false;
    bool pending = false;   // submitted, completion not yet observed
};

struct Driver {
    // Surface description handed to the swapchain.
    VkSurfaceCapabilitiesKHR caps{};
    VkResult capsResult = VK_SUCCESS;
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;
    std::map<VkFormat, VkFormatFeatureFlags> formatFeatures;  // formats absent here get defaultFeatures
    VkFormatFeatureFlags defaultFeatures = 0;
    uint32_t swapchainImageCount = 3;

    // Scripted results, consumed front to back; VK_SUCCESS once empty.
    std::deque<VkResult> acquireResults;
    std::deque<VkResult> presentResults;
    std::deque<VkResult> submitResults;
    std::deque<VkResult> waitResults;
    std::deque<VkResult> createSwapchainResults;

    // Observed state.
    std::map<uint64_t, FenceState> fences;
    std::map<uint64_t, uint64_t> cmdFence;   // command buffer -> fence of its last submission
    std::vector<VkFence> waitedFences;
    uint32_t acquireCalls = 0;
    uint32_t presentCalls = 0;
    uint32_t submitCalls = 0;
    uint32_t waitCalls = 0;
    uint32_t swapchainsCreated = 0;
    uint32_t liveSwapchains = 0;
    uint32_t liveViews = 0;
    uint32_t liveSemaphores = 0;
    uint32_t liveFences = 0;
    uint32_t livePools = 0;
    uint32_t liveQueryPools = 0;
    uint32_t maxPending = 0;
    VkSwapchainKHR lastOldSwapchain = VK_NULL_HANDLE;
    VkSwapchainCreateInfoKHR lastSwapchainInfo{};
    uint32_t nextImage = 0;

    // Protocol violations a real driver would turn into undefined behaviour.
    uint32_t submitWithSignaledFence = 0;
    uint32_t submitWhilePending = 0;
    uint32_t recordWhilePending = 0;
    uint32_t resetWhilePending = 0;
    uint32_t waitOnUnsubmitted = 0;

    uint64_t nextHandle = 0x100;

    uint32_t pendingCount() const;
    uint32_t violations() const {
        return submitWithSignaledFence + submitWhilePending + recordWhilePending +
               resetWhilePending + waitOnUnsubmitted;
    }
};

// Reset the driver to a healthy 1280x720 surface and install the fakes.
Driver& install();
Driver& driver();

VkDevice device();
VkPhysicalDevice physicalDevice();
VkSurfaceKHR surface();
VkQueue queue();

} // namespace fake
