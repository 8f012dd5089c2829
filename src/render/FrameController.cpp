#include "FrameController.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/Errors.h"
#include "core/LifetimeTracker.h"
#include "platform/Swapchain.h"

namespace render {

const char* to_string(SlotState s) {
    switch (s) {
        case SlotState::Idle: return "idle";
        case SlotState::Recording: return "recording";
        case SlotState::Submitted: return "submitted";
    }
    return "unknown";
}

const char* to_string(FrameStatus s) {
    switch (s) {
        case FrameStatus::Ok: return "ok";
        case FrameStatus::SkipFrame: return "skip-frame";
        case FrameStatus::DeviceLost: return "device-lost";
        case FrameStatus::SwapchainLost: return "swapchain-lost";
    }
    return "unknown";
}

bool FrameController::init(const FrameControllerCreateInfo& info) {
    if (!info.device || !info.graphicsQueue) {
        spdlog::error("FrameController: device and graphics queue are required");
        return false;
    }
    info_ = info;
    if (!info_.presentQueue) info_.presentQueue = info_.graphicsQueue;
    framesInFlight_ = core::clamp_frames_in_flight(static_cast<long>(info.framesInFlight));
    frameNumber_ = 0;
    submittedSerial_ = 0;
    completedSerial_ = 0;
    consecutiveRebuilds_ = 0;
    deviceLost_ = false;

    const bool timing = info_.gpuTiming && info_.timestampPeriodNs > 0.0f;
    VkDevice device = info_.device;
    for (uint32_t i = 0; i < framesInFlight_; ++i) {
        FrameSlot& slot = slots_[i];

        VkCommandPoolCreateInfo cpci{};
        cpci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        cpci.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        cpci.queueFamilyIndex = info_.queueFamily;
        if (vkCreateCommandPool(device, &cpci, nullptr, &slot.pool) != VK_SUCCESS) {
            spdlog::error("FrameController: failed to create command pool for slot {}", i);
            shutdown();
            return false;
        }

        VkCommandBufferAllocateInfo cbai{};
        cbai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        cbai.commandPool = slot.pool;
        cbai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        cbai.commandBufferCount = 1;
        if (vkAllocateCommandBuffers(device, &cbai, &slot.cmd) != VK_SUCCESS) {
            spdlog::error("FrameController: failed to allocate command buffer for slot {}", i);
            shutdown();
            return false;
        }

        VkSemaphoreCreateInfo sci{};
        sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
        VkFenceCreateInfo fci{};
        fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
        if (vkCreateSemaphore(device, &sci, nullptr, &slot.imageAvailable) != VK_SUCCESS ||
            vkCreateSemaphore(device, &sci, nullptr, &slot.renderFinished) != VK_SUCCESS ||
            vkCreateFence(device, &fci, nullptr, &slot.inFlight) != VK_SUCCESS) {
            spdlog::error("FrameController: failed to create sync objects for slot {}", i);
            shutdown();
            return false;
        }

        if (timing) {
            VkQueryPoolCreateInfo qpci{};
            qpci.sType = VK_STRUCTURE_TYPE_QUERY_POOL_CREATE_INFO;
            qpci.queryType = VK_QUERY_TYPE_TIMESTAMP;
            qpci.queryCount = 2;
            if (vkCreateQueryPool(device, &qpci, nullptr, &slot.timestamps) != VK_SUCCESS) {
                spdlog::warn("FrameController: timestamp query pool unavailable, GPU timing disabled for slot {}", i);
                slot.timestamps = VK_NULL_HANDLE;
            }
        }
        slot.state = SlotState::Idle;
        slot.serial = 0;
        slot.timingPending = false;
    }
    spdlog::info("FrameController: {} frames in flight (gpu timing {})", framesInFlight_, timing ? "on" : "off");
    return true;
}

void FrameController::destroySlot(FrameSlot& slot) {
    VkDevice device = info_.device;
    if (slot.timestamps) vkDestroyQueryPool(device, slot.timestamps, nullptr);
    if (slot.inFlight) vkDestroyFence(device, slot.inFlight, nullptr);
    if (slot.renderFinished) vkDestroySemaphore(device, slot.renderFinished, nullptr);
    if (slot.imageAvailable) vkDestroySemaphore(device, slot.imageAvailable, nullptr);
    if (slot.pool) vkDestroyCommandPool(device, slot.pool, nullptr);
    slot = FrameSlot{};
}

void FrameController::shutdown() {
    if (!info_.device) return;
    if (!drain()) {
        spdlog::warn("FrameController: drain failed during shutdown; releasing slots anyway");
    }
    for (auto& slot : slots_) destroySlot(slot);
    framesInFlight_ = 0;
    info_ = FrameControllerCreateInfo{};
}

bool FrameController::waitSlot(FrameSlot& slot) {
    if (slot.state != SlotState::Submitted) return true;
    VkResult res = vkWaitForFences(info_.device, 1, &slot.inFlight, VK_TRUE, info_.fenceTimeoutNs);
    if (res != VK_SUCCESS) {
        core::SyncError err = core::classify_sync(res);
        spdlog::critical("FrameController: fence wait for submission {} failed: {} ({})",
                         slot.serial, core::to_string(err), static_cast<int>(res));
        deviceLost_ = true;
        return false;
    }
    // Queue order: every submission up to this serial has completed too.
    completedSerial_ = std::max(completedSerial_, slot.serial);
    if (info_.tracker) info_.tracker->markCompleted(completedSerial_);
    readGpuTiming(slot);
    slot.state = SlotState::Idle;
    return true;
}

void FrameController::readGpuTiming(FrameSlot& slot) {
    if (!slot.timingPending || !slot.timestamps) return;
    slot.timingPending = false;
    uint64_t ticks[2] = {0, 0};
    VkResult res = vkGetQueryPoolResults(info_.device, slot.timestamps, 0, 2, sizeof(ticks), ticks,
                                         sizeof(uint64_t), VK_QUERY_RESULT_64_BIT);
    if (res != VK_SUCCESS || ticks[1] < ticks[0]) return;
    lastGpuTimeMs_ = static_cast<double>(ticks[1] - ticks[0]) * info_.timestampPeriodNs * 1e-6;
}

bool FrameController::drain() {
    bool ok = true;
    for (uint32_t i = 0; i < framesInFlight_; ++i) {
        if (!waitSlot(slots_[i])) {
            ok = false;
            continue;
        }
        slots_[i].state = SlotState::Idle;
    }
    return ok;
}

FrameStatus FrameController::rebuildSwapchain(platform::Swapchain& swapchain, FrameContext& ctx) {
    if (consecutiveRebuilds_ >= info_.maxConsecutiveRebuilds) {
        spdlog::critical("Swapchain still out of date after {} consecutive rebuilds", consecutiveRebuilds_);
        return FrameStatus::SwapchainLost;
    }
    // Old images and views may still be referenced by in-flight frames.
    if (!drain()) return FrameStatus::DeviceLost;

    core::SwapchainStatus st = swapchain.rebuild(swapchain.pendingWidth(), swapchain.pendingHeight());
    if (st == core::SwapchainStatus::Fatal) {
        spdlog::critical("Swapchain rebuild failed; no compatible surface configuration");
        return FrameStatus::SwapchainLost;
    }
    if (st == core::SwapchainStatus::OutOfDate) {
        return FrameStatus::SkipFrame;
    }
    ++consecutiveRebuilds_;
    ctx.swapchainRebuilt = true;
    return FrameStatus::Ok;
}

FrameStatus FrameController::beginFrame(platform::Swapchain& swapchain, FrameContext& ctx) {
    ctx = FrameContext{};
    if (deviceLost_) return FrameStatus::DeviceLost;
    if (framesInFlight_ == 0) {
        spdlog::error("FrameController::beginFrame before init");
        return FrameStatus::DeviceLost;
    }

    const uint32_t slotIndex = static_cast<uint32_t>(frameNumber_ % framesInFlight_);
    FrameSlot& slot = slots_[slotIndex];
    if (!waitSlot(slot)) return FrameStatus::DeviceLost;

    // The cap bounds the acquire/rebuild loop below. Frames that present and
    // then find the chain out of date again (window drag) never accumulate.
    consecutiveRebuilds_ = 0;
    uint32_t imageIndex = 0;
    for (;;) {
        if (swapchain.state() == platform::SwapchainState::OutOfDate) {
            FrameStatus st = rebuildSwapchain(swapchain, ctx);
            if (st != FrameStatus::Ok) return st;
        }
        core::SwapchainStatus acq = swapchain.acquireNextImage(slot.imageAvailable, imageIndex);
        if (acq == core::SwapchainStatus::Ok) break;
        if (acq == core::SwapchainStatus::Fatal) {
            spdlog::critical("Swapchain acquire failed fatally");
            return FrameStatus::SwapchainLost;
        }
    }

    VkDevice device = info_.device;
    if (vkResetFences(device, 1, &slot.inFlight) != VK_SUCCESS ||
        vkResetCommandPool(device, slot.pool, 0) != VK_SUCCESS) {
        spdlog::critical("FrameController: failed to reset slot {} fence/command pool", slotIndex);
        deviceLost_ = true;
        return FrameStatus::DeviceLost;
    }
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(slot.cmd, &bi) != VK_SUCCESS) {
        spdlog::critical("FrameController: vkBeginCommandBuffer failed for slot {}", slotIndex);
        deviceLost_ = true;
        return FrameStatus::DeviceLost;
    }
    if (slot.timestamps) {
        vkCmdResetQueryPool(slot.cmd, slot.timestamps, 0, 2);
        vkCmdWriteTimestamp2(slot.cmd, VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT, slot.timestamps, 0);
    }
    slot.state = SlotState::Recording;

    ctx.slot = slotIndex;
    ctx.imageIndex = imageIndex;
    ctx.frameNumber = frameNumber_;
    ctx.serial = submittedSerial_ + 1;
    ctx.cmd = slot.cmd;
    ctx.swapchainImage = swapchain.image(imageIndex);
    ctx.swapchainView = swapchain.imageView(imageIndex);
    ctx.format = swapchain.format();
    ctx.extent = swapchain.extent();
    return FrameStatus::Ok;
}

FrameStatus FrameController::endFrame(platform::Swapchain& swapchain, FrameContext& ctx) {
    if (deviceLost_) return FrameStatus::DeviceLost;
    if (ctx.slot >= framesInFlight_ || slots_[ctx.slot].state != SlotState::Recording ||
        slots_[ctx.slot].cmd != ctx.cmd) {
        spdlog::critical("FrameController::endFrame without a matching beginFrame (slot {})", ctx.slot);
        return FrameStatus::DeviceLost;
    }
    FrameSlot& slot = slots_[ctx.slot];

    if (slot.timestamps) {
        vkCmdWriteTimestamp2(slot.cmd, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, slot.timestamps, 1);
    }
    if (vkEndCommandBuffer(slot.cmd) != VK_SUCCESS) {
        spdlog::critical("FrameController: vkEndCommandBuffer failed for slot {}", ctx.slot);
        deviceLost_ = true;
        slot.state = SlotState::Idle;
        return FrameStatus::DeviceLost;
    }

    VkSemaphoreSubmitInfo waitInfo{};
    waitInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    waitInfo.semaphore = slot.imageAvailable;
    waitInfo.stageMask = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT |
                         VK_PIPELINE_STAGE_2_TRANSFER_BIT |
                         VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
    VkSemaphoreSubmitInfo signalInfo{};
    signalInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signalInfo.semaphore = slot.renderFinished;
    signalInfo.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = slot.cmd;

    VkSubmitInfo2 submit{};
    submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submit.waitSemaphoreInfoCount = 1;
    submit.pWaitSemaphoreInfos = &waitInfo;
    submit.commandBufferInfoCount = 1;
    submit.pCommandBufferInfos = &cmdInfo;
    submit.signalSemaphoreInfoCount = 1;
    submit.pSignalSemaphoreInfos = &signalInfo;

    VkResult res = vkQueueSubmit2(info_.graphicsQueue, 1, &submit, slot.inFlight);
    if (res != VK_SUCCESS) {
        spdlog::critical("FrameController: vkQueueSubmit2 failed ({}); treating as device loss", static_cast<int>(res));
        deviceLost_ = true;
        slot.state = SlotState::Idle;
        return FrameStatus::DeviceLost;
    }
    slot.serial = ++submittedSerial_;
    slot.state = SlotState::Submitted;
    slot.timingPending = slot.timestamps != VK_NULL_HANDLE;
    ++frameNumber_;

    core::SwapchainStatus st = swapchain.present(info_.presentQueue, ctx.imageIndex, slot.renderFinished);
    switch (st) {
        case core::SwapchainStatus::Ok:
            return FrameStatus::Ok;
        case core::SwapchainStatus::OutOfDate:
            // Rebuilt at the start of the next frame.
            return FrameStatus::Ok;
        case core::SwapchainStatus::Fatal:
            break;
    }
    spdlog::critical("Swapchain present failed fatally");
    return FrameStatus::SwapchainLost;
}

void FrameController::trackUse(const FrameContext& ctx, core::ResourceId id) {
    if (info_.tracker) info_.tracker->markInUse(id, ctx.serial);
}

} // namespace render
