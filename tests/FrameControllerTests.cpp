// Frame slot rotation, fence discipline and swapchain recovery against the scripted driver.
#include <cmath>
#include <cstdarg>
#include <cstdio>

#include <spdlog/spdlog.h>

#include "FakeDriver.h"
#include "core/LifetimeTracker.h"
#include "platform/Swapchain.h"
#include "render/FrameController.h"

using render::FrameContext;
using render::FrameController;
using render::FrameControllerCreateInfo;
using render::FrameStatus;
using render::SlotState;

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "FrameControllerTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

struct Harness {
    platform::Swapchain swapchain;
    FrameController frames;
    core::LifetimeTracker tracker;

    bool init(uint32_t framesInFlight, uint32_t maxRebuilds = 3, bool gpuTiming = false) {
        platform::SwapchainCreateInfo sci{};
        sci.device = fake::device();
        sci.physicalDevice = fake::physicalDevice();
        sci.surface = fake::surface();
        sci.width = 1280;
        sci.height = 720;
        if (swapchain.create(sci) != core::SwapchainStatus::Ok) return false;

        FrameControllerCreateInfo fci{};
        fci.device = fake::device();
        fci.graphicsQueue = fake::queue();
        fci.framesInFlight = framesInFlight;
        fci.maxConsecutiveRebuilds = maxRebuilds;
        fci.gpuTiming = gpuTiming;
        fci.timestampPeriodNs = 1.0f;
        fci.tracker = &tracker;
        return frames.init(fci);
    }

    FrameStatus frame(FrameContext* out = nullptr) {
        FrameContext ctx;
        FrameStatus st = frames.beginFrame(swapchain, ctx);
        if (out) *out = ctx;
        if (st != FrameStatus::Ok) return st;
        return frames.endFrame(swapchain, ctx);
    }

    ~Harness() {
        frames.shutdown();
        swapchain.destroy();
    }
};

} // namespace

#define CHECK(cond, msg, ...) \
    do { \
        if (!(cond)) { \
            logFailureFmt(__FILE__, __LINE__, msg, ##__VA_ARGS__); \
            success = false; \
        } \
    } while (0)

int main() {
    spdlog::set_level(spdlog::level::off);
    bool success = true;

    // Slots rotate modulo N and never exceed N submissions in flight
    for (uint32_t n : {2u, 3u}) {
        fake::Driver& d = fake::install();
        Harness h;
        CHECK(h.init(n), "harness init (n=%u)", n);
        CHECK(h.frames.framesInFlight() == n, "framesInFlight=%u expected %u", h.frames.framesInFlight(), n);
        for (uint32_t i = 0; i < 12; ++i) {
            FrameContext ctx;
            FrameStatus st = h.frame(&ctx);
            CHECK(st == FrameStatus::Ok, "frame %u failed (%s)", i, render::to_string(st));
            CHECK(ctx.slot == i % n, "frame %u used slot %u", i, ctx.slot);
            CHECK(ctx.frameNumber == i, "frame number %llu expected %u", static_cast<unsigned long long>(ctx.frameNumber), i);
            CHECK(ctx.serial == i + 1, "serial %llu expected %u", static_cast<unsigned long long>(ctx.serial), i + 1);
            if (i >= n) {
                CHECK(!d.waitedFences.empty() && d.waitedFences.back() == h.frames.slotFence(ctx.slot),
                      "frame %u should wait on its own slot fence", i);
            }
        }
        CHECK(d.maxPending == n, "in-flight high-water %u expected %u", d.maxPending, n);
        CHECK(d.violations() == 0, "fence protocol violations: %u", d.violations());
        CHECK(h.frames.submittedSerial() == 12, "submitted serial %llu", static_cast<unsigned long long>(h.frames.submittedSerial()));
        CHECK(h.frames.completedSerial() == 12 - n, "completed serial %llu expected %u",
              static_cast<unsigned long long>(h.frames.completedSerial()), 12 - n);
        CHECK(d.waitCalls == 12 - n, "first N frames must not wait (waits=%u)", d.waitCalls);
    }

    // Out-of-range frame counts are clamped
    {
        fake::install();
        Harness a;
        CHECK(a.init(7), "init with 7");
        CHECK(a.frames.framesInFlight() == core::kMaxFramesInFlight, "7 clamps to max (%u)", a.frames.framesInFlight());
        Harness b;
        CHECK(b.init(0), "init with 0");
        CHECK(b.frames.framesInFlight() == core::kMinFramesInFlight, "0 clamps to min (%u)", b.frames.framesInFlight());
    }

    // Drain waits every submitted slot and leaves them idle
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(3);
        for (int i = 0; i < 3; ++i) h.frame();
        CHECK(d.pendingCount() == 3, "three submissions outstanding (%u)", d.pendingCount());
        CHECK(h.frames.drain(), "drain succeeds");
        CHECK(d.pendingCount() == 0, "nothing outstanding after drain (%u)", d.pendingCount());
        for (uint32_t i = 0; i < 3; ++i) {
            CHECK(h.frames.slotState(i) == SlotState::Idle, "slot %u idle after drain (%s)", i,
                  render::to_string(h.frames.slotState(i)));
        }
        CHECK(h.frames.completedSerial() == 3, "completed serial after drain %llu",
              static_cast<unsigned long long>(h.frames.completedSerial()));
    }

    // Out-of-date acquire drains, rebuilds and retries within the same beginFrame
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        h.frame();
        h.frame();
        d.acquireResults = {VK_ERROR_OUT_OF_DATE_KHR};
        const uint32_t created = d.swapchainsCreated;
        FrameContext ctx;
        FrameStatus st = h.frames.beginFrame(h.swapchain, ctx);
        CHECK(st == FrameStatus::Ok, "recovered frame (%s)", render::to_string(st));
        CHECK(ctx.swapchainRebuilt, "frame reports the rebuild");
        CHECK(d.swapchainsCreated == created + 1, "exactly one rebuild (%u)", d.swapchainsCreated - created);
        CHECK(d.pendingCount() == 0, "rebuild happened only after every slot retired (%u pending)", d.pendingCount());
        CHECK(h.frames.endFrame(h.swapchain, ctx) == FrameStatus::Ok, "endFrame after rebuild");
        CHECK(d.violations() == 0, "fence protocol violations: %u", d.violations());
    }

    // Out-of-date present is routine; the next frame rebuilds
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        d.presentResults = {VK_ERROR_OUT_OF_DATE_KHR};
        CHECK(h.frame() == FrameStatus::Ok, "out-of-date present is not an error");
        CHECK(h.swapchain.state() == platform::SwapchainState::OutOfDate, "swapchain marked out of date");
        FrameContext ctx;
        CHECK(h.frame(&ctx) == FrameStatus::Ok, "next frame recovers");
        CHECK(ctx.swapchainRebuilt, "next frame carries the rebuild");
        CHECK(h.swapchain.rebuildCount() == 1, "one rebuild (%u)", h.swapchain.rebuildCount());
    }

    // Resize to a new size is picked up at the next frame
    {
        fake::install();
        Harness h;
        h.init(2);
        h.frame();
        h.swapchain.notifySurfaceResized(800, 600);
        FrameContext ctx;
        CHECK(h.frame(&ctx) == FrameStatus::Ok, "frame after resize");
        CHECK(ctx.swapchainRebuilt && ctx.extent.width == 800 && ctx.extent.height == 600,
              "frame sees the new extent (%ux%u)", ctx.extent.width, ctx.extent.height);
    }

    // A zero-area surface skips frames without acquiring or submitting
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        h.frame();
        h.swapchain.notifySurfaceResized(0, 0);
        const uint32_t acquires = d.acquireCalls;
        const uint32_t submits = d.submitCalls;
        for (int i = 0; i < 5; ++i) {
            FrameStatus st = h.frame();
            CHECK(st == FrameStatus::SkipFrame, "minimized frame %d should skip (%s)", i, render::to_string(st));
        }
        CHECK(d.acquireCalls == acquires && d.submitCalls == submits,
              "no acquire/submit while minimized (acquires=%u submits=%u)", d.acquireCalls - acquires, d.submitCalls - submits);
        h.swapchain.notifySurfaceResized(640, 480);
        FrameContext ctx;
        CHECK(h.frame(&ctx) == FrameStatus::Ok, "restore resumes rendering");
        CHECK(ctx.extent.width == 640 && ctx.extent.height == 480, "restored extent (%ux%u)", ctx.extent.width, ctx.extent.height);
    }

    // A surface that never stabilizes ends the loop after the rebuild cap
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2, 3);
        for (int i = 0; i < 16; ++i) d.acquireResults.push_back(VK_ERROR_OUT_OF_DATE_KHR);
        FrameStatus st = h.frame();
        CHECK(st == FrameStatus::SwapchainLost, "endless out-of-date should give up (%s)", render::to_string(st));
        CHECK(h.swapchain.rebuildCount() == 3, "rebuilds capped at 3 (%u)", h.swapchain.rebuildCount());
    }

    // One out-of-date per frame never hits the cap: each beginFrame starts a fresh count
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2, 3);
        for (int i = 0; i < 10; ++i) {
            d.acquireResults.push_back(VK_ERROR_OUT_OF_DATE_KHR);
            d.acquireResults.push_back(VK_SUCCESS);
        }
        for (int i = 0; i < 10; ++i) {
            FrameStatus st = h.frame();
            CHECK(st == FrameStatus::Ok, "frame %d should recover (%s)", i, render::to_string(st));
        }
        CHECK(h.swapchain.rebuildCount() == 10, "one rebuild per frame (%u)", h.swapchain.rebuildCount());
    }

    // Suboptimal presents during a drag keep rendering: each frame presents,
    // so the rebuilds that follow never add up to the cap
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2, 3);
        for (int i = 0; i < 10; ++i) d.presentResults.push_back(VK_SUBOPTIMAL_KHR);
        for (int i = 0; i < 10; ++i) {
            FrameStatus st = h.frame();
            CHECK(st == FrameStatus::Ok, "suboptimal present %d stays invisible (%s)", i, render::to_string(st));
        }
        CHECK(h.swapchain.rebuildCount() == 9, "rebuild before each following frame (%u)", h.swapchain.rebuildCount());
        CHECK(d.presentCalls == 10, "every frame presented (%u)", d.presentCalls);
        CHECK(d.violations() == 0, "no protocol violations (%u)", d.violations());
    }

    // Resizes landing between acquire and present behave the same way
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(3, 3);
        for (uint32_t i = 0; i < 8; ++i) {
            FrameContext ctx;
            FrameStatus st = h.frames.beginFrame(h.swapchain, ctx);
            CHECK(st == FrameStatus::Ok, "drag frame %u begins (%s)", i, render::to_string(st));
            if (st != FrameStatus::Ok) break;
            h.swapchain.notifySurfaceResized(800 + 10 * i, 600);
            st = h.frames.endFrame(h.swapchain, ctx);
            CHECK(st == FrameStatus::Ok, "drag frame %u presents (%s)", i, render::to_string(st));
        }
        CHECK(h.swapchain.rebuildCount() == 7, "one rebuild per following frame (%u)", h.swapchain.rebuildCount());
        CHECK(d.violations() == 0, "no protocol violations (%u)", d.violations());
    }

    // Fence failures are device loss and stick
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        h.frame();
        h.frame();
        d.waitResults = {VK_ERROR_DEVICE_LOST};
        CHECK(h.frame() == FrameStatus::DeviceLost, "lost fence wait ends the loop");
        CHECK(h.frames.deviceLost(), "device loss latched");
        CHECK(h.frame() == FrameStatus::DeviceLost, "device loss is sticky");
    }
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        h.frame();
        h.frame();
        d.waitResults = {VK_TIMEOUT};
        CHECK(h.frame() == FrameStatus::DeviceLost, "fence timeout is treated as device loss");
    }

    // Submit failure is device loss
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        d.submitResults = {VK_ERROR_DEVICE_LOST};
        CHECK(h.frame() == FrameStatus::DeviceLost, "failed submit ends the loop");
        CHECK(h.frames.slotState(0) == SlotState::Idle, "failed slot is not left submitted");
    }

    // Present surface loss is fatal to the swapchain
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2);
        d.presentResults = {VK_ERROR_SURFACE_LOST_KHR};
        CHECK(h.frame() == FrameStatus::SwapchainLost, "surface loss ends the loop");
    }

    // endFrame needs a matching beginFrame
    {
        fake::install();
        Harness h;
        h.init(2);
        FrameContext bogus;
        CHECK(h.frames.endFrame(h.swapchain, bogus) == FrameStatus::DeviceLost, "endFrame without beginFrame is rejected");
        bogus.slot = 9;
        CHECK(h.frames.endFrame(h.swapchain, bogus) == FrameStatus::DeviceLost, "out-of-range slot is rejected");
        CHECK(!h.frames.deviceLost(), "misuse is not a device loss");
        CHECK(h.frame() == FrameStatus::Ok, "controller still usable");
    }

    // Resources used by a frame cannot be released until its fence is observed
    {
        fake::install();
        Harness h;
        h.init(2);
        h.tracker.setEnabled(true);
        const core::ResourceId id = 42;
        FrameContext ctx;
        CHECK(h.frames.beginFrame(h.swapchain, ctx) == FrameStatus::Ok, "begin");
        h.frames.trackUse(ctx, id);
        CHECK(h.frames.endFrame(h.swapchain, ctx) == FrameStatus::Ok, "end");
        CHECK(h.tracker.isInFlight(id), "resource in flight after submit");
        CHECK(!h.tracker.checkRelease(id), "early release refused");
        CHECK(h.tracker.violationCount() == 1, "violation counted (%llu)",
              static_cast<unsigned long long>(h.tracker.violationCount()));
        h.frame();
        h.frame();  // reuses slot 0 and waits its fence
        CHECK(!h.tracker.isInFlight(id), "resource retired once its frame completed");
        CHECK(h.tracker.checkRelease(id), "release allowed after completion");
    }

    // GPU timestamps are read back when a slot is reused
    {
        fake::Driver& d = fake::install();
        Harness h;
        h.init(2, 3, true);
        CHECK(d.liveQueryPools == 2, "one timestamp pool per slot (%u)", d.liveQueryPools);
        for (int i = 0; i < 3; ++i) h.frame();
        CHECK(std::fabs(h.frames.lastGpuTimeMs() - 0.002) < 1e-9, "2000 ticks at 1 ns = 0.002 ms (got %g)",
              h.frames.lastGpuTimeMs());
    }

    // Shutdown drains and releases every per-slot object
    {
        fake::Driver& d = fake::install();
        {
            Harness h;
            h.init(3, 3, true);
            for (int i = 0; i < 5; ++i) h.frame();
            h.frames.shutdown();
            CHECK(d.pendingCount() == 0, "shutdown drains (%u pending)", d.pendingCount());
            CHECK(d.livePools == 0 && d.liveFences == 0 && d.liveSemaphores == 0 && d.liveQueryPools == 0,
                  "slot objects released (pools=%u fences=%u semaphores=%u queries=%u)",
                  d.livePools, d.liveFences, d.liveSemaphores, d.liveQueryPools);
        }
        CHECK(d.liveSwapchains == 0 && d.liveViews == 0, "swapchain released (chains=%u views=%u)",
              d.liveSwapchains, d.liveViews);
    }

    return success ? 0 : 1;
}
