#pragma once

#include <cstdint>

#include <volk.h>

#include "core/Errors.h"

// Forward declare VMA handles; vk_mem_alloc.h is only included by GpuAllocator.cpp.
typedef struct VmaAllocator_T* VmaAllocator;
typedef struct VmaAllocation_T* VmaAllocation;

// GpuAllocator: VMA-backed buffers and images with live counts.
namespace core {

using ResourceId = uint64_t;
constexpr ResourceId kInvalidResource = 0;

// Owned {buffer, allocation} pair. Move-only; released explicitly through the
// device context (or a Scoped wrapper), never by the destructor.
struct AllocatedBuffer {
    VkBuffer buffer = VK_NULL_HANDLE;
    VmaAllocation allocation = nullptr;
    VkDeviceSize size = 0;
    VkDeviceAddress address = 0; // set when usage includes SHADER_DEVICE_ADDRESS
    void* mapped = nullptr;      // set for host-visible memory
    ResourceId id = kInvalidResource;

    AllocatedBuffer() = default;
    AllocatedBuffer(const AllocatedBuffer&) = delete;
    AllocatedBuffer& operator=(const AllocatedBuffer&) = delete;
    AllocatedBuffer(AllocatedBuffer&& o) noexcept;
    AllocatedBuffer& operator=(AllocatedBuffer&& o) noexcept;

    bool valid() const { return buffer != VK_NULL_HANDLE; }
};

struct AllocatedImage {
    VkImage image = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    VmaAllocation allocation = nullptr;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    ResourceId id = kInvalidResource;

    AllocatedImage() = default;
    AllocatedImage(const AllocatedImage&) = delete;
    AllocatedImage& operator=(const AllocatedImage&) = delete;
    AllocatedImage(AllocatedImage&& o) noexcept;
    AllocatedImage& operator=(AllocatedImage&& o) noexcept;

    bool valid() const { return image != VK_NULL_HANDLE; }
};

struct MemoryBudget {
    VkDeviceSize usage = 0;
    VkDeviceSize budget = 0;
};

class GpuAllocator {
public:
    struct InitInfo {
        VkInstance instance = VK_NULL_HANDLE;
        VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
        VkDevice device = VK_NULL_HANDLE;
        uint32_t apiVersion = VK_API_VERSION_1_3;
        bool bufferDeviceAddress = true;
    };

    bool init(const InitInfo& info);
    // Returns false when allocations are still live (they are reported, then leaked).
    bool shutdown();

    AllocationError createBuffer(VkDeviceSize size,
                                 VkBufferUsageFlags usage,
                                 VkMemoryPropertyFlags properties,
                                 AllocatedBuffer& out);
    AllocationError createImage(VkExtent2D extent,
                                VkFormat format,
                                VkImageUsageFlags usage,
                                VkMemoryPropertyFlags properties,
                                AllocatedImage& out);
    void destroy(AllocatedBuffer& buffer);
    void destroy(AllocatedImage& image);

    // Sum over heaps of the process-wide VMA budget.
    MemoryBudget budget() const;
    void logBudget() const;

    bool valid() const { return allocator_ != nullptr; }
    VmaAllocator handle() const { return allocator_; }
    uint32_t liveBuffers() const { return liveBuffers_; }
    uint32_t liveImages() const { return liveImages_; }

private:
    VmaAllocator allocator_ = nullptr;
    VkDevice device_ = VK_NULL_HANDLE;
    ResourceId nextId_ = 1;
    uint32_t liveBuffers_ = 0;
    uint32_t liveImages_ = 0;
};

}
