#pragma once

// GLFW window that owns nothing Vulkan-side: the surface it creates belongs to
// the caller and must be destroyed before the instance.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <volk.h>

struct GLFWwindow;

namespace platform {

struct WindowDesc {
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "vkbase";
};

struct FramebufferSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

class Window {
public:
    Window() = default;
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    ~Window() { destroy(); }

    bool create(const WindowDesc& desc);
    void destroy();

    void poll();
    // Sleeps until something happens; used while there is nothing to present to.
    void waitEvents();
    bool shouldClose() const;

    // Instance extensions GLFW needs for surfaces; empty when unavailable.
    static std::vector<const char*> surfaceExtensions();
    VkSurfaceKHR createSurface(VkInstance instance) const;

    // Latest framebuffer size if it changed since the previous call.
    std::optional<FramebufferSize> takeResize();

    FramebufferSize framebufferSize() const { return size_; }
    // Iconified, or a framebuffer with no area.
    bool presentable() const { return !iconified_ && size_.width > 0 && size_.height > 0; }

private:
    static void onFramebufferSize(GLFWwindow* window, int width, int height);
    static void onIconify(GLFWwindow* window, int iconified);

    GLFWwindow* window_ = nullptr;
    FramebufferSize size_{};
    bool resizePending_ = false;
    bool iconified_ = false;
    bool glfwInitialized_ = false;
};

} // namespace platform
