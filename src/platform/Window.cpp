#include "Window.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>

namespace platform {

namespace {

void onGlfwError(int code, const char* description) {
    spdlog::error("GLFW error 0x{:x}: {}", code, description ? description : "(no description)");
}

uint32_t clampSize(int v) { return v > 0 ? static_cast<uint32_t>(v) : 0u; }

Window* owner(GLFWwindow* window) {
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

} // namespace

bool Window::create(const WindowDesc& desc) {
    destroy();
    glfwSetErrorCallback(onGlfwError);
    if (glfwInit() != GLFW_TRUE) {
        spdlog::error("GLFW initialization failed");
        return false;
    }
    glfwInitialized_ = true;
    if (glfwVulkanSupported() != GLFW_TRUE) {
        spdlog::error("GLFW found no Vulkan loader");
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window_ = glfwCreateWindow(static_cast<int>(desc.width), static_cast<int>(desc.height),
                               desc.title.c_str(), nullptr, nullptr);
    if (!window_) {
        spdlog::error("glfwCreateWindow({}x{}) failed", desc.width, desc.height);
        return false;
    }

    int fbw = 0, fbh = 0;
    glfwGetFramebufferSize(window_, &fbw, &fbh);
    size_ = FramebufferSize{clampSize(fbw), clampSize(fbh)};
    iconified_ = glfwGetWindowAttrib(window_, GLFW_ICONIFIED) == GLFW_TRUE;

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, &Window::onFramebufferSize);
    glfwSetWindowIconifyCallback(window_, &Window::onIconify);
    glfwSetKeyCallback(window_, [](GLFWwindow* win, int key, int, int action, int) {
        if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) glfwSetWindowShouldClose(win, GLFW_TRUE);
    });
    return true;
}

void Window::destroy() {
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfwInitialized_) {
        glfwTerminate();
        glfwInitialized_ = false;
    }
    size_ = {};
    resizePending_ = false;
    iconified_ = false;
}

void Window::onFramebufferSize(GLFWwindow* window, int width, int height) {
    if (Window* self = owner(window)) {
        self->size_ = FramebufferSize{clampSize(width), clampSize(height)};
        self->resizePending_ = true;
    }
}

void Window::onIconify(GLFWwindow* window, int iconified) {
    if (Window* self = owner(window)) {
        self->iconified_ = iconified == GLFW_TRUE;
        spdlog::debug("Window {}", self->iconified_ ? "iconified" : "restored");
    }
}

void Window::poll() {
    if (window_) glfwPollEvents();
}

void Window::waitEvents() {
    if (window_) glfwWaitEvents();
}

bool Window::shouldClose() const {
    return !window_ || glfwWindowShouldClose(window_) == GLFW_TRUE;
}

std::vector<const char*> Window::surfaceExtensions() {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names) {
        spdlog::error("GLFW cannot create Vulkan surfaces on this platform");
        return {};
    }
    return std::vector<const char*>(names, names + count);
}

VkSurfaceKHR Window::createSurface(VkInstance instance) const {
    if (!window_ || !instance) return VK_NULL_HANDLE;
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (VkResult res = glfwCreateWindowSurface(instance, window_, nullptr, &surface); res != VK_SUCCESS) {
        spdlog::error("glfwCreateWindowSurface failed ({})", static_cast<int>(res));
        return VK_NULL_HANDLE;
    }
    return surface;
}

std::optional<FramebufferSize> Window::takeResize() {
    if (!resizePending_) return std::nullopt;
    resizePending_ = false;
    return size_;
}

} // namespace platform
