#include "App.h"

#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Logging.h"

namespace app {

App::App()
    : ctx_{window_, vk_, swap_, upload_, frames_, targets_, config_} {}

int App::run(Example& example, int argc, char** argv) {
    core::RuntimeConfig defaults;
    example.configure(defaults);
    config_ = core::determine_runtime_config(argc, argv, defaults);
    core::init_logging(config_.log);
    spdlog::info("vkbase example '{}'", example.name());
    core::log_runtime_config(config_);

    int code = 1;
    if (initialize(example)) {
        code = mainLoop(example);
    } else {
        spdlog::critical("Initialization failed; exiting");
    }
    shutdown(example);
    spdlog::info("Exit code {}", code);
    core::shutdown_logging();
    return code;
}

bool App::initialize(Example& example) {
    platform::WindowDesc desc;
    desc.title = example.name();
    if (!window_.create(desc)) {
        return false;
    }
    const platform::FramebufferSize fb = window_.framebufferSize();
    spdlog::info("Window created ({}x{})", fb.width, fb.height);

    const std::vector<const char*> instanceExts = platform::Window::surfaceExtensions();
    if (instanceExts.empty()) return false;
    if (!vk_.initInstance(instanceExts, config_.enableValidation)) {
        spdlog::error("initInstance failed");
        return false;
    }
    surface_ = window_.createSurface(vk_.instance());
    if (!surface_) {
        return false;
    }

    platform::DeviceRequirements req = example.requirements();
    req.lifetimeChecks = config_.lifetimeChecks;
    if (!vk_.initDevice(surface_, req)) {
        spdlog::error("initDevice failed");
        return false;
    }
    if (!upload_.init(vk_)) {
        return false;
    }

    platform::SwapchainCreateInfo sci{};
    sci.device = vk_.device();
    sci.physicalDevice = vk_.physicalDevice();
    sci.surface = surface_;
    sci.graphicsQueueFamily = vk_.graphicsFamily();
    sci.presentQueueFamily = vk_.presentFamily();
    sci.width = fb.width;
    sci.height = fb.height;
    sci.vsync = config_.preferVsync;
    if (swap_.create(sci) == core::SwapchainStatus::Fatal) {
        spdlog::error("Swapchain creation failed");
        return false;
    }

    render::FrameControllerCreateInfo fci{};
    fci.device = vk_.device();
    fci.graphicsQueue = vk_.graphicsQueue();
    fci.presentQueue = vk_.presentQueue();
    fci.queueFamily = vk_.graphicsFamily();
    fci.framesInFlight = config_.framesInFlight;
    fci.fenceTimeoutNs = config_.fenceTimeoutNs;
    fci.maxConsecutiveRebuilds = config_.maxConsecutiveRebuilds;
    fci.gpuTiming = config_.gpuTiming && vk_.deviceInfo().timestampsSupported;
    fci.timestampPeriodNs = vk_.deviceInfo().timestampPeriodNs;
    fci.tracker = &vk_.lifetimeTracker();
    if (!frames_.init(fci)) {
        return false;
    }

    // A window created minimized has no swapchain extent yet; targets follow the first rebuild.
    VkExtent2D extent = swap_.extent();
    if (extent.width == 0 || extent.height == 0) extent = VkExtent2D{1, 1};
    if (!targets_.init(vk_, upload_, frames_.framesInFlight(), extent)) {
        spdlog::error("Render target creation failed");
        return false;
    }

    // shutdown() runs for a partially initialized example too.
    exampleStarted_ = true;
    if (!example.init(ctx_)) {
        spdlog::error("Example '{}' failed to initialize", example.name());
        return false;
    }
    vk_.allocator().logBudget();
    return true;
}

int App::mainLoop(Example& example) {
    auto last = std::chrono::steady_clock::now();
    while (!window_.shouldClose()) {
        window_.poll();
        if (auto size = window_.takeResize()) {
            swap_.notifySurfaceResized(size->width, size->height);
        }
        if (!window_.presentable()) {
            window_.waitEvents();
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;
        example.update(dt);

        render::FrameContext frame;
        render::FrameStatus st = frames_.beginFrame(swap_, frame);
        if (st == render::FrameStatus::SkipFrame) {
            continue;
        }
        if (st != render::FrameStatus::Ok) {
            spdlog::critical("Frame loop stopped: {}", render::to_string(st));
            return 1;
        }
        if (frame.swapchainRebuilt) {
            if (!targets_.resize(frame.extent)) {
                spdlog::critical("Render targets could not follow swapchain resize to {}x{}",
                                 frame.extent.width, frame.extent.height);
                return 1;
            }
            if (!example.onSwapchainRebuilt(ctx_)) {
                spdlog::critical("Example '{}' failed to handle swapchain rebuild", example.name());
                return 1;
            }
        }

        const core::AllocatedImage& target = targets_.target(frame.slot);
        frames_.trackUse(frame, target.id);

        graph_.beginFrame();
        example.recordFrame(ctx_, frame, graph_);
        const bool presentable =
            graph_.addPass("copy-to-swapchain", VK_PIPELINE_STAGE_2_BLIT_BIT, [&](VkCommandBuffer cmd) {
                targets_.recordCopyToSwapchain(cmd, frame.slot, frame.swapchainImage, frame.extent);
            }) &&
            graph_.addPass("present-transition", VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                           [&](VkCommandBuffer cmd) {
                               render::RenderTargets::recordPresentTransition(cmd, frame.swapchainImage);
                           });
        if (!presentable) {
            spdlog::critical("Example '{}' took a pass name reserved for presentation", example.name());
            return 1;
        }
        graph_.execute(frame.cmd);
        graph_.endFrame();

        st = frames_.endFrame(swap_, frame);
        if (st != render::FrameStatus::Ok) {
            spdlog::critical("Frame loop stopped: {}", render::to_string(st));
            return 1;
        }
        logFrameStats(dt);
    }
    return 0;
}

void App::logFrameStats(float dt) {
    ++statFrames_;
    statSeconds_ += dt;
    if (statSeconds_ < 1.0) return;
    const double fps = statFrames_ / statSeconds_;
    const double cpuMs = 1000.0 * statSeconds_ / statFrames_;
    spdlog::debug("{:.1f} fps | frame {:.2f} ms | gpu {:.2f} ms | frame #{}",
                  fps, cpuMs, frames_.lastGpuTimeMs(), frames_.frameNumber());
    statFrames_ = 0;
    statSeconds_ = 0.0;
}

void App::shutdown(Example& example) {
    // Nothing below may be released while a slot is still executing.
    if (!frames_.drain()) {
        spdlog::warn("Drain failed during shutdown; waiting for device idle instead");
        if (!vk_.waitIdle()) {
            spdlog::error("Device did not go idle during shutdown");
        }
    }
    if (exampleStarted_) {
        example.shutdown(ctx_);
        exampleStarted_ = false;
    }
    targets_.shutdown();
    frames_.shutdown();
    upload_.shutdown();
    swap_.destroy();
    if (surface_) {
        vkDestroySurfaceKHR(vk_.instance(), surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    vk_.shutdown();
    window_.destroy();
}

} // namespace app
