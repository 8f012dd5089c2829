#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <optional>

#include <volk.h>

#include "core/Errors.h"
#include "core/GpuAllocator.h"
#include "core/LifetimeTracker.h"

namespace platform {

struct QueueFamilies {
    std::optional<uint32_t> graphics; // graphics + compute
    std::optional<uint32_t> present;  // when a surface is provided
    bool complete(bool needPresent) const { return graphics.has_value() && (!needPresent || present.has_value()); }
};

struct DeviceRequirements {
    bool rayQuery = true;            // acceleration structures + ray queries from compute/fragment
    bool rayTracingPipeline = false; // enabled when available, never required
    bool lifetimeChecks = true;
};

struct RayTracingProperties {
    bool accelerationStructure = false;
    bool rayQuery = false;
    bool rayTracingPipeline = false;
    VkDeviceSize minScratchOffsetAlignment = 0;
    uint64_t maxGeometryCount = 0;
    uint64_t maxInstanceCount = 0;
    uint64_t maxPrimitiveCount = 0;
    uint32_t shaderGroupHandleSize = 0;
    uint32_t shaderGroupHandleAlignment = 0;
    uint32_t shaderGroupBaseAlignment = 0;
    uint32_t maxRayRecursionDepth = 0;
};

struct DeviceInfo {
    uint32_t apiVersion = 0;
    std::string name;
    float timestampPeriodNs = 0.0f;
    bool timestampsSupported = false;
};

// Device Context: instance, logical device, queues and the process-wide
// allocator. Every GPU buffer/image is created and destroyed through it.
class VulkanContext {
public:
    bool initInstance(const std::vector<const char*>& extraInstanceExts, bool enableValidation = true);
    bool initDevice(VkSurfaceKHR surface = VK_NULL_HANDLE, const DeviceRequirements& req = {});
    void shutdown();

    core::AllocationError createBuffer(VkDeviceSize size,
                                       VkBufferUsageFlags usage,
                                       VkMemoryPropertyFlags properties,
                                       core::AllocatedBuffer& out);
    core::AllocationError createImage(VkExtent2D extent,
                                      VkFormat format,
                                      VkImageUsageFlags usage,
                                      VkMemoryPropertyFlags properties,
                                      core::AllocatedImage& out);
    // Refuses (returns false, resource untouched) when the lifetime tracker
    // reports the resource as still referenced by an unfinished frame.
    bool destroy(core::AllocatedBuffer& buffer);
    bool destroy(core::AllocatedImage& image);

    bool waitIdle();

    // Accessors
    VkInstance       instance() const { return instance_; }
    VkPhysicalDevice physicalDevice() const { return physicalDevice_; }
    VkDevice         device() const { return device_; }
    VkQueue          graphicsQueue() const { return graphicsQueue_; }
    VkQueue          presentQueue() const { return presentQueue_ ? presentQueue_ : graphicsQueue_; }
    uint32_t         graphicsFamily() const { return queueFamilies_.graphics.value_or(0); }
    uint32_t         presentFamily() const { return queueFamilies_.present.value_or(graphicsFamily()); }
    const DeviceInfo& deviceInfo() const { return deviceInfo_; }
    const RayTracingProperties& rayTracing() const { return rayTracing_; }
    bool validationEnabled() const { return validationEnabled_; }

    core::GpuAllocator& allocator() { return allocator_; }
    core::LifetimeTracker& lifetimeTracker() { return tracker_; }
    const core::LifetimeTracker& lifetimeTracker() const { return tracker_; }

private:
    bool createInstance(const std::vector<const char*>& extraExts, bool enableValidation);
    void setupDebugMessenger();
    bool pickPhysicalDevice(VkSurfaceKHR surface, const DeviceRequirements& req);
    bool createDevice(VkSurfaceKHR surface, const DeviceRequirements& req);
    void queryRayTracingProperties();
    void destroyDebugMessenger();

private:
    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debugMessenger_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    QueueFamilies queueFamilies_{};
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;
    DeviceInfo deviceInfo_{};
    RayTracingProperties rayTracing_{};
    bool validationEnabled_ = false;
    bool debugUtilsEnabled_ = false;

    core::GpuAllocator allocator_;
    core::LifetimeTracker tracker_;
};

} // namespace platform
