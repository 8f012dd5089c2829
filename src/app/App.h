#pragma once

#include <volk.h>

#include "core/Config.h"
#include "core/FrameGraph.h"
#include "core/Upload.h"
#include "platform/Swapchain.h"
#include "platform/VulkanContext.h"
#include "platform/Window.h"
#include "render/FrameController.h"
#include "render/RenderTargets.h"

namespace app {

// Everything an example may touch. Owned by App for the whole run.
struct AppContext {
    platform::Window& window;
    platform::VulkanContext& vk;
    platform::Swapchain& swapchain;
    core::UploadContext& upload;
    render::FrameController& frames;
    render::RenderTargets& targets;
    const core::RuntimeConfig& config;
};

class Example {
public:
    virtual ~Example() = default;

    virtual const char* name() const = 0;
    // Per-example defaults; env and CLI still override them.
    virtual void configure(core::RuntimeConfig& defaults) { (void)defaults; }
    virtual platform::DeviceRequirements requirements() const { return {}; }
    virtual bool init(AppContext& ctx) = 0;
    virtual void update(float dt) { (void)dt; }
    // Passes write the slot's render target; the runner appends the copy into
    // the swapchain image and the present transition.
    virtual void recordFrame(AppContext& ctx, const render::FrameContext& frame, core::FrameGraph& graph) = 0;
    // Render targets have already been resized when this runs.
    virtual bool onSwapchainRebuilt(AppContext& ctx) { (void)ctx; return true; }
    virtual void shutdown(AppContext& ctx) = 0;
};

class App {
public:
    App();
    int run(Example& example, int argc, char** argv);

private:
    bool initialize(Example& example);
    int mainLoop(Example& example);
    void shutdown(Example& example);
    void logFrameStats(float dt);

    core::RuntimeConfig config_{};
    platform::Window window_;
    platform::VulkanContext vk_;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    platform::Swapchain swap_;
    core::UploadContext upload_;
    render::FrameController frames_;
    render::RenderTargets targets_;
    core::FrameGraph graph_;
    AppContext ctx_;
    bool exampleStarted_ = false;

    uint32_t statFrames_ = 0;
    double statSeconds_ = 0.0;
};

} // namespace app
