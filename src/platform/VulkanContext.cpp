#include "VulkanContext.h"

#include <cstring>
#include <vector>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/Logging.h"

namespace platform {

static bool hasLayer(const std::vector<VkLayerProperties>& layers, const char* name) {
    for (auto& l : layers) if (std::strcmp(l.layerName, name) == 0) return true;
    return false;
}
static bool hasExtension(const std::vector<VkExtensionProperties>& exts, const char* name) {
    for (auto& e : exts) if (std::strcmp(e.extensionName, name) == 0) return true;
    return false;
}

static std::vector<VkExtensionProperties> deviceExtensions(VkPhysicalDevice pd) {
    uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(pd, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> exts(count);
    vkEnumerateDeviceExtensionProperties(pd, nullptr, &count, exts.data());
    exts.resize(count);
    return exts;
}

static VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT type,
    const VkDebugUtilsMessengerCallbackDataEXT* callbackData,
    void* userData) {
    (void)userData;
    spdlog::level::level_enum level = spdlog::level::trace;
    if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        level = spdlog::level::err;
    } else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        level = spdlog::level::warn;
    } else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
        level = spdlog::level::debug;
    }
    const char* kind = (type & VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT)    ? "validation"
                     : (type & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT) ? "performance"
                                                                               : "general";
    const char* id = (callbackData && callbackData->pMessageIdName) ? callbackData->pMessageIdName : "-";
    const char* msg = (callbackData && callbackData->pMessage) ? callbackData->pMessage : "(null)";
    core::validation_logger()->log(level, "{} [{}] {}", kind, id, msg);
    return VK_FALSE;
}

// Feature structs queried and enabled together.
struct FeatureChain {
    VkPhysicalDeviceFeatures2 core{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2};
    VkPhysicalDeviceVulkan12Features v12{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES};
    VkPhysicalDeviceVulkan13Features v13{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES};
    VkPhysicalDeviceAccelerationStructureFeaturesKHR accel{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_ACCELERATION_STRUCTURE_FEATURES_KHR};
    VkPhysicalDeviceRayQueryFeaturesKHR rayQuery{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_QUERY_FEATURES_KHR};
    VkPhysicalDeviceRayTracingPipelineFeaturesKHR rtPipeline{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_TRACING_PIPELINE_FEATURES_KHR};

    // Links core -> v12 -> v13 [-> accel -> rayQuery [-> rtPipeline]].
    void link(bool withRayQuery, bool withPipeline) {
        core.pNext = &v12;
        v12.pNext = &v13;
        v13.pNext = withRayQuery ? static_cast<void*>(&accel) : nullptr;
        accel.pNext = withRayQuery ? static_cast<void*>(&rayQuery) : nullptr;
        rayQuery.pNext = withPipeline ? static_cast<void*>(&rtPipeline) : nullptr;
        rtPipeline.pNext = nullptr;
    }
};

bool VulkanContext::createInstance(const std::vector<const char*>& extraExts, bool enableValidation) {
    if (volkInitialize() != VK_SUCCESS) {
        spdlog::error("volkInitialize failed: no Vulkan loader found");
        return false;
    }

    uint32_t apiVer = 0;
    vkEnumerateInstanceVersion(&apiVer);
    if (apiVer < VK_API_VERSION_1_3) {
        spdlog::error("Vulkan 1.3 loader required (found {}.{})",
                      VK_API_VERSION_MAJOR(apiVer), VK_API_VERSION_MINOR(apiVer));
        return false;
    }

    std::vector<const char*> layers;
    std::vector<const char*> exts;
    for (auto* e : extraExts) exts.push_back(e);
    if (enableValidation) {
        uint32_t lc = 0; vkEnumerateInstanceLayerProperties(&lc, nullptr);
        std::vector<VkLayerProperties> avail(lc); vkEnumerateInstanceLayerProperties(&lc, avail.data());
        if (hasLayer(avail, "VK_LAYER_KHRONOS_validation")) {
            layers.push_back("VK_LAYER_KHRONOS_validation");
        } else {
            spdlog::warn("Validation requested but VK_LAYER_KHRONOS_validation is not installed");
        }
        uint32_t ec = 0; vkEnumerateInstanceExtensionProperties(nullptr, &ec, nullptr);
        std::vector<VkExtensionProperties> instExts(ec); vkEnumerateInstanceExtensionProperties(nullptr, &ec, instExts.data());
        if (hasExtension(instExts, VK_EXT_DEBUG_UTILS_EXTENSION_NAME)) {
            exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            debugUtilsEnabled_ = true;
        }
    }

    VkApplicationInfo appInfo{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
    appInfo.pApplicationName = "vkbase";
    appInfo.pEngineName = "vkbase";
    appInfo.apiVersion = VK_API_VERSION_1_3;

    VkInstanceCreateInfo ci{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
    ci.pApplicationInfo = &appInfo;
    ci.enabledLayerCount = static_cast<uint32_t>(layers.size());
    ci.ppEnabledLayerNames = layers.empty() ? nullptr : layers.data();
    ci.enabledExtensionCount = static_cast<uint32_t>(exts.size());
    ci.ppEnabledExtensionNames = exts.empty() ? nullptr : exts.data();

    VkResult res = vkCreateInstance(&ci, nullptr, &instance_);
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateInstance failed ({})", static_cast<int>(res));
        instance_ = VK_NULL_HANDLE;
        return false;
    }

    volkLoadInstance(instance_);
    return true;
}

void VulkanContext::setupDebugMessenger() {
    if (!debugUtilsEnabled_ || !vkCreateDebugUtilsMessengerEXT) return;
    VkDebugUtilsMessengerCreateInfoEXT info{ VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT };
    info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                           VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                       VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    info.pfnUserCallback = debugCallback;
    VkResult res = vkCreateDebugUtilsMessengerEXT(instance_, &info, nullptr, &debugMessenger_);
    if (res != VK_SUCCESS) {
        spdlog::warn("vkCreateDebugUtilsMessengerEXT failed ({}); validation output goes to the loader", static_cast<int>(res));
        debugMessenger_ = VK_NULL_HANDLE;
    }
}

bool VulkanContext::pickPhysicalDevice(VkSurfaceKHR surface, const DeviceRequirements& req) {
    uint32_t count = 0; vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (count == 0) {
        spdlog::error("No Vulkan physical devices");
        return false;
    }
    std::vector<VkPhysicalDevice> devs(count);
    vkEnumeratePhysicalDevices(instance_, &count, devs.data());

    // Score devices: prefer discrete, then integrated.
    auto scoreDevice = [&](VkPhysicalDevice pd) -> int {
        VkPhysicalDeviceProperties props; vkGetPhysicalDeviceProperties(pd, &props);
        int score = 0;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) score += 1000;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) score += 500;
        return score;
    };
    std::stable_sort(devs.begin(), devs.end(), [&](auto a, auto b){ return scoreDevice(a) > scoreDevice(b); });

    for (auto pd : devs) {
        VkPhysicalDeviceProperties props; vkGetPhysicalDeviceProperties(pd, &props);
        if (props.apiVersion < VK_API_VERSION_1_3) {
            spdlog::debug("Skipping {}: Vulkan 1.3 not supported", props.deviceName);
            continue;
        }

        uint32_t qCount = 0; vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, nullptr);
        std::vector<VkQueueFamilyProperties> qprops(qCount);
        vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, qprops.data());
        QueueFamilies qf{};
        const VkQueueFlags needed = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
        for (uint32_t i = 0; i < qCount; ++i) {
            if ((qprops[i].queueFlags & needed) == needed) { qf.graphics = i; break; }
        }
        if (!qf.graphics) continue;
        if (surface) {
            // Prefer presenting from the graphics family.
            VkBool32 supported = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(pd, *qf.graphics, surface, &supported);
            if (supported) {
                qf.present = *qf.graphics;
            } else {
                for (uint32_t i = 0; i < qCount; ++i) {
                    vkGetPhysicalDeviceSurfaceSupportKHR(pd, i, surface, &supported);
                    if (supported) { qf.present = i; break; }
                }
            }
        }
        if (!qf.complete(surface != VK_NULL_HANDLE)) continue;

        auto exts = deviceExtensions(pd);
        std::vector<const char*> required;
        if (surface) required.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
        if (req.rayQuery) {
            required.push_back(VK_KHR_ACCELERATION_STRUCTURE_EXTENSION_NAME);
            required.push_back(VK_KHR_RAY_QUERY_EXTENSION_NAME);
            required.push_back(VK_KHR_DEFERRED_HOST_OPERATIONS_EXTENSION_NAME);
        }
        const char* missing = nullptr;
        for (const char* name : required) {
            if (!hasExtension(exts, name)) { missing = name; break; }
        }
        if (missing) {
            spdlog::debug("Skipping {}: missing {}", props.deviceName, missing);
            continue;
        }

        FeatureChain feats;
        feats.link(req.rayQuery, false);
        vkGetPhysicalDeviceFeatures2(pd, &feats.core);
        bool ok = feats.v12.bufferDeviceAddress && feats.v13.synchronization2 && feats.v13.dynamicRendering;
        if (req.rayQuery) ok = ok && feats.accel.accelerationStructure && feats.rayQuery.rayQuery;
        if (!ok) {
            spdlog::debug("Skipping {}: required features missing", props.deviceName);
            continue;
        }

        physicalDevice_ = pd;
        queueFamilies_ = qf;
        deviceInfo_.apiVersion = props.apiVersion;
        deviceInfo_.name = props.deviceName;
        deviceInfo_.timestampPeriodNs = props.limits.timestampPeriod;
        deviceInfo_.timestampsSupported = props.limits.timestampComputeAndGraphics == VK_TRUE;
        return true;
    }
    spdlog::error("No physical device satisfies the requirements (rayQuery={}, surface={})",
                  req.rayQuery, surface != VK_NULL_HANDLE);
    return false;
}

bool VulkanContext::createDevice(VkSurfaceKHR surface, const DeviceRequirements& req) {
    auto avail = deviceExtensions(physicalDevice_);
    std::vector<const char*> devExts;
    if (surface) devExts.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    bool withPipeline = false;
    if (req.rayQuery) {
        devExts.push_back(VK_KHR_ACCELERATION_STRUCTURE_EXTENSION_NAME);
        devExts.push_back(VK_KHR_RAY_QUERY_EXTENSION_NAME);
        devExts.push_back(VK_KHR_DEFERRED_HOST_OPERATIONS_EXTENSION_NAME);
        if (req.rayTracingPipeline && hasExtension(avail, VK_KHR_RAY_TRACING_PIPELINE_EXTENSION_NAME)) {
            devExts.push_back(VK_KHR_RAY_TRACING_PIPELINE_EXTENSION_NAME);
            withPipeline = true;
        }
    }

    FeatureChain feats;
    feats.link(req.rayQuery, withPipeline);
    vkGetPhysicalDeviceFeatures2(physicalDevice_, &feats.core);
    if (withPipeline && !feats.rtPipeline.rayTracingPipeline) {
        devExts.pop_back();
        withPipeline = false;
        feats.link(req.rayQuery, false);
    }

    // Only enable what the substrate relies on.
    VkPhysicalDeviceFeatures2 enabled{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2};
    enabled.features.shaderInt64 = feats.core.features.shaderInt64;
    VkPhysicalDeviceVulkan12Features v12{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES};
    v12.bufferDeviceAddress = VK_TRUE;
    v12.timelineSemaphore = feats.v12.timelineSemaphore;
    v12.hostQueryReset = feats.v12.hostQueryReset;
    VkPhysicalDeviceVulkan13Features v13{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES};
    v13.synchronization2 = VK_TRUE;
    v13.dynamicRendering = VK_TRUE;
    VkPhysicalDeviceAccelerationStructureFeaturesKHR accel{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_ACCELERATION_STRUCTURE_FEATURES_KHR};
    accel.accelerationStructure = VK_TRUE;
    VkPhysicalDeviceRayQueryFeaturesKHR rayQuery{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_QUERY_FEATURES_KHR};
    rayQuery.rayQuery = VK_TRUE;
    VkPhysicalDeviceRayTracingPipelineFeaturesKHR rtPipeline{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_TRACING_PIPELINE_FEATURES_KHR};
    rtPipeline.rayTracingPipeline = VK_TRUE;

    enabled.pNext = &v12;
    v12.pNext = &v13;
    if (req.rayQuery) {
        v13.pNext = &accel;
        accel.pNext = &rayQuery;
        if (withPipeline) rayQuery.pNext = &rtPipeline;
    }

    float prio = 1.0f;
    std::vector<uint32_t> uniqIdx = { queueFamilies_.graphics.value() };
    if (queueFamilies_.present && *queueFamilies_.present != *queueFamilies_.graphics) {
        uniqIdx.push_back(*queueFamilies_.present);
    }
    std::vector<VkDeviceQueueCreateInfo> qcis;
    for (uint32_t idx : uniqIdx) {
        VkDeviceQueueCreateInfo qci{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        qci.queueFamilyIndex = idx;
        qci.queueCount = 1;
        qci.pQueuePriorities = &prio;
        qcis.push_back(qci);
    }

    VkDeviceCreateInfo dci{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
    dci.pNext = &enabled;
    dci.queueCreateInfoCount = static_cast<uint32_t>(qcis.size());
    dci.pQueueCreateInfos = qcis.data();
    dci.enabledExtensionCount = static_cast<uint32_t>(devExts.size());
    dci.ppEnabledExtensionNames = devExts.empty() ? nullptr : devExts.data();

    VkResult res = vkCreateDevice(physicalDevice_, &dci, nullptr, &device_);
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateDevice failed ({})", static_cast<int>(res));
        device_ = VK_NULL_HANDLE;
        return false;
    }
    volkLoadDevice(device_);

    vkGetDeviceQueue(device_, queueFamilies_.graphics.value(), 0, &graphicsQueue_);
    if (queueFamilies_.present) {
        vkGetDeviceQueue(device_, *queueFamilies_.present, 0, &presentQueue_);
    }

    rayTracing_.accelerationStructure = req.rayQuery;
    rayTracing_.rayQuery = req.rayQuery;
    rayTracing_.rayTracingPipeline = withPipeline;
    return true;
}

void VulkanContext::queryRayTracingProperties() {
    if (!rayTracing_.accelerationStructure) return;
    VkPhysicalDeviceAccelerationStructurePropertiesKHR asProps{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_ACCELERATION_STRUCTURE_PROPERTIES_KHR};
    VkPhysicalDeviceRayTracingPipelinePropertiesKHR rtProps{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_TRACING_PIPELINE_PROPERTIES_KHR};
    VkPhysicalDeviceProperties2 props2{VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2};
    props2.pNext = &asProps;
    if (rayTracing_.rayTracingPipeline) asProps.pNext = &rtProps;
    vkGetPhysicalDeviceProperties2(physicalDevice_, &props2);

    rayTracing_.minScratchOffsetAlignment = asProps.minAccelerationStructureScratchOffsetAlignment;
    rayTracing_.maxGeometryCount = asProps.maxGeometryCount;
    rayTracing_.maxInstanceCount = asProps.maxInstanceCount;
    rayTracing_.maxPrimitiveCount = asProps.maxPrimitiveCount;
    if (rayTracing_.rayTracingPipeline) {
        rayTracing_.shaderGroupHandleSize = rtProps.shaderGroupHandleSize;
        rayTracing_.shaderGroupHandleAlignment = rtProps.shaderGroupHandleAlignment;
        rayTracing_.shaderGroupBaseAlignment = rtProps.shaderGroupBaseAlignment;
        rayTracing_.maxRayRecursionDepth = rtProps.maxRayRecursionDepth;
    }
    spdlog::debug("AS properties: scratchAlign={} maxGeometry={} maxInstances={} maxPrimitives={}",
                  static_cast<uint64_t>(rayTracing_.minScratchOffsetAlignment), rayTracing_.maxGeometryCount,
                  rayTracing_.maxInstanceCount, rayTracing_.maxPrimitiveCount);
    if (rayTracing_.rayTracingPipeline) {
        spdlog::debug("RT pipeline properties: handleSize={} handleAlign={} baseAlign={} maxRecursion={}",
                      rayTracing_.shaderGroupHandleSize, rayTracing_.shaderGroupHandleAlignment,
                      rayTracing_.shaderGroupBaseAlignment, rayTracing_.maxRayRecursionDepth);
    }
}

void VulkanContext::destroyDebugMessenger() {
    if (!debugMessenger_) return;
    if (vkDestroyDebugUtilsMessengerEXT) vkDestroyDebugUtilsMessengerEXT(instance_, debugMessenger_, nullptr);
    debugMessenger_ = VK_NULL_HANDLE;
}

bool VulkanContext::initInstance(const std::vector<const char*>& extraExts, bool enableValidation) {
    validationEnabled_ = enableValidation;
    if (!createInstance(extraExts, enableValidation)) return false;
    setupDebugMessenger();
    return true;
}

bool VulkanContext::initDevice(VkSurfaceKHR surface, const DeviceRequirements& req) {
    if (!instance_) {
        spdlog::error("initDevice called before initInstance");
        return false;
    }
    if (!pickPhysicalDevice(surface, req)) return false;
    if (!createDevice(surface, req)) return false;
    queryRayTracingProperties();

    core::GpuAllocator::InitInfo ai{};
    ai.instance = instance_;
    ai.physicalDevice = physicalDevice_;
    ai.device = device_;
    ai.apiVersion = VK_API_VERSION_1_3;
    ai.bufferDeviceAddress = true;
    if (!allocator_.init(ai)) return false;

    tracker_.setEnabled(req.lifetimeChecks);
    spdlog::info("Device: {} (api {}.{}.{}) graphicsFamily={} presentFamily={} rayQuery={} rtPipeline={}",
                 deviceInfo_.name,
                 VK_API_VERSION_MAJOR(deviceInfo_.apiVersion),
                 VK_API_VERSION_MINOR(deviceInfo_.apiVersion),
                 VK_API_VERSION_PATCH(deviceInfo_.apiVersion),
                 graphicsFamily(), presentFamily(),
                 rayTracing_.rayQuery, rayTracing_.rayTracingPipeline);
    return true;
}

core::AllocationError VulkanContext::createBuffer(VkDeviceSize size,
                                                  VkBufferUsageFlags usage,
                                                  VkMemoryPropertyFlags properties,
                                                  core::AllocatedBuffer& out) {
    return allocator_.createBuffer(size, usage, properties, out);
}

core::AllocationError VulkanContext::createImage(VkExtent2D extent,
                                                 VkFormat format,
                                                 VkImageUsageFlags usage,
                                                 VkMemoryPropertyFlags properties,
                                                 core::AllocatedImage& out) {
    return allocator_.createImage(extent, format, usage, properties, out);
}

bool VulkanContext::destroy(core::AllocatedBuffer& buffer) {
    if (!buffer.valid()) return true;
    if (!tracker_.checkRelease(buffer.id)) return false;
    allocator_.destroy(buffer);
    return true;
}

bool VulkanContext::destroy(core::AllocatedImage& image) {
    if (!image.valid()) return true;
    if (!tracker_.checkRelease(image.id)) return false;
    allocator_.destroy(image);
    return true;
}

bool VulkanContext::waitIdle() {
    if (!device_) return true;
    VkResult res = vkDeviceWaitIdle(device_);
    if (res != VK_SUCCESS) {
        spdlog::error("vkDeviceWaitIdle failed ({})", static_cast<int>(res));
        return false;
    }
    return true;
}

void VulkanContext::shutdown() {
    if (device_) {
        if (!waitIdle()) {
            spdlog::warn("Tearing down device without a confirmed idle point");
        }
        if (tracker_.violationCount() > 0) {
            spdlog::warn("{} resource lifetime violations recorded this run", tracker_.violationCount());
        }
        if (!allocator_.shutdown()) {
            spdlog::error("Device destroyed with live allocations");
        }
        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
        graphicsQueue_ = VK_NULL_HANDLE;
        presentQueue_ = VK_NULL_HANDLE;
    }
    destroyDebugMessenger();
    if (instance_) { vkDestroyInstance(instance_, nullptr); instance_ = VK_NULL_HANDLE; }
}

} // namespace platform
