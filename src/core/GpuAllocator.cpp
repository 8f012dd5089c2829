#include "GpuAllocator.h"

#include <utility>

#include <spdlog/spdlog.h>

#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>

namespace core {

AllocatedBuffer::AllocatedBuffer(AllocatedBuffer&& o) noexcept
    : buffer(std::exchange(o.buffer, VK_NULL_HANDLE)),
      allocation(std::exchange(o.allocation, nullptr)),
      size(std::exchange(o.size, 0)),
      address(std::exchange(o.address, 0)),
      mapped(std::exchange(o.mapped, nullptr)),
      id(std::exchange(o.id, kInvalidResource)) {}

AllocatedBuffer& AllocatedBuffer::operator=(AllocatedBuffer&& o) noexcept {
    if (this != &o) {
        if (valid()) {
            spdlog::error("AllocatedBuffer #{} overwritten while still owning a buffer (leaked)", id);
        }
        buffer = std::exchange(o.buffer, VK_NULL_HANDLE);
        allocation = std::exchange(o.allocation, nullptr);
        size = std::exchange(o.size, 0);
        address = std::exchange(o.address, 0);
        mapped = std::exchange(o.mapped, nullptr);
        id = std::exchange(o.id, kInvalidResource);
    }
    return *this;
}

AllocatedImage::AllocatedImage(AllocatedImage&& o) noexcept
    : image(std::exchange(o.image, VK_NULL_HANDLE)),
      view(std::exchange(o.view, VK_NULL_HANDLE)),
      allocation(std::exchange(o.allocation, nullptr)),
      format(std::exchange(o.format, VK_FORMAT_UNDEFINED)),
      extent(std::exchange(o.extent, VkExtent2D{})),
      id(std::exchange(o.id, kInvalidResource)) {}

AllocatedImage& AllocatedImage::operator=(AllocatedImage&& o) noexcept {
    if (this != &o) {
        if (valid()) {
            spdlog::error("AllocatedImage #{} overwritten while still owning an image (leaked)", id);
        }
        image = std::exchange(o.image, VK_NULL_HANDLE);
        view = std::exchange(o.view, VK_NULL_HANDLE);
        allocation = std::exchange(o.allocation, nullptr);
        format = std::exchange(o.format, VK_FORMAT_UNDEFINED);
        extent = std::exchange(o.extent, VkExtent2D{});
        id = std::exchange(o.id, kInvalidResource);
    }
    return *this;
}

namespace {

VkImageAspectFlags aspectForFormat(VkFormat format) {
    switch (format) {
        case VK_FORMAT_D16_UNORM:
        case VK_FORMAT_D32_SFLOAT:
        case VK_FORMAT_X8_D24_UNORM_PACK32:
            return VK_IMAGE_ASPECT_DEPTH_BIT;
        case VK_FORMAT_D16_UNORM_S8_UINT:
        case VK_FORMAT_D24_UNORM_S8_UINT:
        case VK_FORMAT_D32_SFLOAT_S8_UINT:
            return VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT;
        default:
            return VK_IMAGE_ASPECT_COLOR_BIT;
    }
}

} // namespace

bool GpuAllocator::init(const InitInfo& info) {
    if (allocator_) {
        spdlog::error("GpuAllocator: init called twice");
        return false;
    }
    if (!info.instance || !info.physicalDevice || !info.device) {
        spdlog::error("GpuAllocator: init requires instance, physical device and device");
        return false;
    }

    // VMA resolves the remaining entry points through volk's loaders.
    VmaVulkanFunctions functions{};
    functions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
    functions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo ci{};
    ci.flags = info.bufferDeviceAddress ? VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT : 0;
    ci.instance = info.instance;
    ci.physicalDevice = info.physicalDevice;
    ci.device = info.device;
    ci.vulkanApiVersion = info.apiVersion;
    ci.pVulkanFunctions = &functions;

    VkResult res = vmaCreateAllocator(&ci, &allocator_);
    if (res != VK_SUCCESS) {
        spdlog::error("vmaCreateAllocator failed ({})", static_cast<int>(res));
        allocator_ = nullptr;
        return false;
    }
    device_ = info.device;
    spdlog::info("GpuAllocator ready (bufferDeviceAddress={})", info.bufferDeviceAddress);
    return true;
}

bool GpuAllocator::shutdown() {
    if (!allocator_) return true;
    if (liveBuffers_ != 0 || liveImages_ != 0) {
        spdlog::error("GpuAllocator: {} buffers and {} images still live at teardown; leaking allocator",
                      liveBuffers_, liveImages_);
        allocator_ = nullptr;
        device_ = VK_NULL_HANDLE;
        return false;
    }
    vmaDestroyAllocator(allocator_);
    allocator_ = nullptr;
    device_ = VK_NULL_HANDLE;
    return true;
}

AllocationError GpuAllocator::createBuffer(VkDeviceSize size,
                                           VkBufferUsageFlags usage,
                                           VkMemoryPropertyFlags properties,
                                           AllocatedBuffer& out) {
    if (!allocator_) {
        spdlog::error("GpuAllocator: createBuffer before init");
        return AllocationError::InvalidRequest;
    }
    if (size == 0 || usage == 0) {
        spdlog::error("GpuAllocator: invalid buffer request (size={} usage=0x{:x})",
                      static_cast<uint64_t>(size), static_cast<uint32_t>(usage));
        return AllocationError::InvalidRequest;
    }
    if (out.valid()) {
        spdlog::error("GpuAllocator: output buffer #{} still owns a resource", out.id);
        return AllocationError::InvalidRequest;
    }

    VkBufferCreateInfo bi{VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    bi.size = size;
    bi.usage = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo ai{};
    ai.usage = VMA_MEMORY_USAGE_UNKNOWN;
    ai.requiredFlags = properties;
    if (properties & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) {
        ai.flags |= VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    VmaAllocationInfo info{};
    VkResult res = vmaCreateBuffer(allocator_, &bi, &ai, &out.buffer, &out.allocation, &info);
    if (res != VK_SUCCESS) {
        AllocationError err = classify_allocation(res);
        spdlog::error("vmaCreateBuffer failed: {} (size={} usage=0x{:x} props=0x{:x})",
                      to_string(err), static_cast<uint64_t>(size),
                      static_cast<uint32_t>(usage), static_cast<uint32_t>(properties));
        out.buffer = VK_NULL_HANDLE;
        out.allocation = nullptr;
        return err;
    }

    out.size = size;
    out.mapped = info.pMappedData;
    out.address = 0;
    if (usage & VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT) {
        VkBufferDeviceAddressInfo addr{VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO};
        addr.buffer = out.buffer;
        out.address = vkGetBufferDeviceAddress(device_, &addr);
    }
    out.id = nextId_++;
    ++liveBuffers_;
    spdlog::debug("alloc buffer #{} size={} usage=0x{:x}", out.id, static_cast<uint64_t>(size),
                  static_cast<uint32_t>(usage));
    return AllocationError::None;
}

AllocationError GpuAllocator::createImage(VkExtent2D extent,
                                          VkFormat format,
                                          VkImageUsageFlags usage,
                                          VkMemoryPropertyFlags properties,
                                          AllocatedImage& out) {
    if (!allocator_) {
        spdlog::error("GpuAllocator: createImage before init");
        return AllocationError::InvalidRequest;
    }
    if (extent.width == 0 || extent.height == 0 || format == VK_FORMAT_UNDEFINED || usage == 0) {
        spdlog::error("GpuAllocator: invalid image request ({}x{} fmt={} usage=0x{:x})",
                      extent.width, extent.height, static_cast<int>(format), static_cast<uint32_t>(usage));
        return AllocationError::InvalidRequest;
    }
    if (out.valid()) {
        spdlog::error("GpuAllocator: output image #{} still owns a resource", out.id);
        return AllocationError::InvalidRequest;
    }

    VkImageCreateInfo ii{VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO};
    ii.imageType = VK_IMAGE_TYPE_2D;
    ii.format = format;
    ii.extent = {extent.width, extent.height, 1};
    ii.mipLevels = 1;
    ii.arrayLayers = 1;
    ii.samples = VK_SAMPLE_COUNT_1_BIT;
    ii.tiling = VK_IMAGE_TILING_OPTIMAL;
    ii.usage = usage;
    ii.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ii.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo ai{};
    ai.usage = VMA_MEMORY_USAGE_UNKNOWN;
    ai.requiredFlags = properties;

    VkResult res = vmaCreateImage(allocator_, &ii, &ai, &out.image, &out.allocation, nullptr);
    if (res != VK_SUCCESS) {
        AllocationError err = classify_allocation(res);
        spdlog::error("vmaCreateImage failed: {} ({}x{} fmt={})", to_string(err),
                      extent.width, extent.height, static_cast<int>(format));
        out.image = VK_NULL_HANDLE;
        out.allocation = nullptr;
        return err;
    }

    VkImageViewCreateInfo vi{VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
    vi.image = out.image;
    vi.viewType = VK_IMAGE_VIEW_TYPE_2D;
    vi.format = format;
    vi.subresourceRange.aspectMask = aspectForFormat(format);
    vi.subresourceRange.levelCount = 1;
    vi.subresourceRange.layerCount = 1;
    res = vkCreateImageView(device_, &vi, nullptr, &out.view);
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateImageView failed ({}) for {}x{} fmt={}", static_cast<int>(res),
                      extent.width, extent.height, static_cast<int>(format));
        vmaDestroyImage(allocator_, out.image, out.allocation);
        out.image = VK_NULL_HANDLE;
        out.allocation = nullptr;
        out.view = VK_NULL_HANDLE;
        return classify_allocation(res);
    }

    out.format = format;
    out.extent = extent;
    out.id = nextId_++;
    ++liveImages_;
    spdlog::debug("alloc image #{} {}x{} fmt={}", out.id, extent.width, extent.height, static_cast<int>(format));
    return AllocationError::None;
}

void GpuAllocator::destroy(AllocatedBuffer& buffer) {
    if (!buffer.valid()) return;
    if (!allocator_) {
        spdlog::error("GpuAllocator: destroy of buffer #{} without an allocator", buffer.id);
        return;
    }
    spdlog::debug("free buffer #{} size={}", buffer.id, static_cast<uint64_t>(buffer.size));
    vmaDestroyBuffer(allocator_, buffer.buffer, buffer.allocation);
    --liveBuffers_;
    buffer.buffer = VK_NULL_HANDLE;
    buffer.allocation = nullptr;
    buffer.size = 0;
    buffer.address = 0;
    buffer.mapped = nullptr;
    buffer.id = kInvalidResource;
}

void GpuAllocator::destroy(AllocatedImage& image) {
    if (!image.valid()) return;
    if (!allocator_) {
        spdlog::error("GpuAllocator: destroy of image #{} without an allocator", image.id);
        return;
    }
    spdlog::debug("free image #{} {}x{}", image.id, image.extent.width, image.extent.height);
    if (image.view) {
        vkDestroyImageView(device_, image.view, nullptr);
    }
    vmaDestroyImage(allocator_, image.image, image.allocation);
    --liveImages_;
    image.image = VK_NULL_HANDLE;
    image.view = VK_NULL_HANDLE;
    image.allocation = nullptr;
    image.format = VK_FORMAT_UNDEFINED;
    image.extent = {};
    image.id = kInvalidResource;
}

MemoryBudget GpuAllocator::budget() const {
    MemoryBudget total{};
    if (!allocator_) return total;
    const VkPhysicalDeviceMemoryProperties* props = nullptr;
    vmaGetMemoryProperties(allocator_, &props);
    VmaBudget budgets[VK_MAX_MEMORY_HEAPS]{};
    vmaGetHeapBudgets(allocator_, budgets);
    for (uint32_t i = 0; props && i < props->memoryHeapCount; ++i) {
        total.usage += budgets[i].usage;
        total.budget += budgets[i].budget;
    }
    return total;
}

void GpuAllocator::logBudget() const {
    MemoryBudget b = budget();
    spdlog::info("GPU memory: {:.1f} MiB used of {:.1f} MiB budget ({} buffers, {} images)",
                 static_cast<double>(b.usage) / (1024.0 * 1024.0),
                 static_cast<double>(b.budget) / (1024.0 * 1024.0),
                 liveBuffers_, liveImages_);
}

}
