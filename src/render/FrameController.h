#pragma once

#include <array>
#include <cstdint>

#include <volk.h>

#include "core/Config.h"
#include "core/GpuAllocator.h"

namespace core { class LifetimeTracker; }
namespace platform { class Swapchain; }

namespace render {

enum class SlotState : uint8_t { Idle, Recording, Submitted };

enum class FrameStatus : uint8_t {
    Ok = 0,
    SkipFrame,      // surface has zero area; nothing recorded this iteration
    DeviceLost,
    SwapchainLost
};

const char* to_string(SlotState s);
const char* to_string(FrameStatus s);

struct FrameContext {
    uint32_t slot = 0;
    uint32_t imageIndex = 0;
    uint64_t frameNumber = 0;
    uint64_t serial = 0;          // submission serial this frame will carry
    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkImage swapchainImage = VK_NULL_HANDLE;
    VkImageView swapchainView = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    bool swapchainRebuilt = false;
};

struct FrameControllerCreateInfo {
    VkDevice device = VK_NULL_HANDLE;
    VkQueue graphicsQueue = VK_NULL_HANDLE;
    VkQueue presentQueue = VK_NULL_HANDLE;
    uint32_t queueFamily = 0;
    uint32_t framesInFlight = core::kMinFramesInFlight;
    uint64_t fenceTimeoutNs = UINT64_MAX;
    uint32_t maxConsecutiveRebuilds = 3;  // per beginFrame; past it the chain is lost
    bool gpuTiming = false;
    float timestampPeriodNs = 0.0f;
    core::LifetimeTracker* tracker = nullptr;
};

// Frame Synchronization Controller.
//
// Slots rotate by frame number modulo N. A slot is only re-recorded after its
// fence has been observed signaled, so at most N frames are in flight. The
// controller owns the loop: it consumes swapchain statuses and decides when to
// drain and rebuild.
class FrameController {
public:
    bool init(const FrameControllerCreateInfo& info);
    void shutdown();

    FrameStatus beginFrame(platform::Swapchain& swapchain, FrameContext& ctx);
    FrameStatus endFrame(platform::Swapchain& swapchain, FrameContext& ctx);

    // Wait for every outstanding submission; all slots end Idle.
    bool drain();

    // The frame being recorded references `id`; releasing it before this
    // frame's fence is observed is a lifetime violation.
    void trackUse(const FrameContext& ctx, core::ResourceId id);

    uint32_t framesInFlight() const { return framesInFlight_; }
    SlotState slotState(uint32_t i) const { return slots_[i].state; }
    uint64_t slotSerial(uint32_t i) const { return slots_[i].serial; }
    VkFence slotFence(uint32_t i) const { return slots_[i].inFlight; }
    uint64_t submittedSerial() const { return submittedSerial_; }
    uint64_t completedSerial() const { return completedSerial_; }
    uint64_t frameNumber() const { return frameNumber_; }
    double lastGpuTimeMs() const { return lastGpuTimeMs_; }
    bool deviceLost() const { return deviceLost_; }

private:
    struct FrameSlot {
        VkCommandPool pool = VK_NULL_HANDLE;
        VkCommandBuffer cmd = VK_NULL_HANDLE;
        VkSemaphore imageAvailable = VK_NULL_HANDLE;
        VkSemaphore renderFinished = VK_NULL_HANDLE;
        VkFence inFlight = VK_NULL_HANDLE;
        VkQueryPool timestamps = VK_NULL_HANDLE;
        SlotState state = SlotState::Idle;
        uint64_t serial = 0;
        bool timingPending = false;
    };

    bool waitSlot(FrameSlot& slot);
    void readGpuTiming(FrameSlot& slot);
    FrameStatus rebuildSwapchain(platform::Swapchain& swapchain, FrameContext& ctx);
    void destroySlot(FrameSlot& slot);

    FrameControllerCreateInfo info_{};
    std::array<FrameSlot, core::kMaxFramesInFlight> slots_{};
    uint32_t framesInFlight_ = 0;
    uint64_t frameNumber_ = 0;
    uint64_t submittedSerial_ = 0;
    uint64_t completedSerial_ = 0;
    uint32_t consecutiveRebuilds_ = 0;
    double lastGpuTimeMs_ = 0.0;
    bool deviceLost_ = false;
};

} // namespace render
