#pragma once

// Descriptor pool and batched descriptor writes for the ray-query compute passes.
//
// A pool is sized once for a fixed number of sets; sets are never freed
// individually and all go away with the pool. Writes are queued on a
// DescriptorWriter and applied with a single vkUpdateDescriptorSets call, so
// every per-slot set is refreshed together after a swapchain rebuild.

#include <cstdint>
#include <deque>
#include <vector>

#include <volk.h>

namespace core {

class DescriptorPool {
public:
    DescriptorPool() = default;
    DescriptorPool(const DescriptorPool&) = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;
    ~DescriptorPool() { shutdown(); }

    bool init(VkDevice device, const std::vector<VkDescriptorPoolSize>& poolSizes, uint32_t maxSets);
    void shutdown();

    // Fills `out` with `count` sets of the same layout; all or nothing.
    bool allocate(VkDescriptorSetLayout layout, uint32_t count, std::vector<VkDescriptorSet>& out);

    bool valid() const { return pool_ != VK_NULL_HANDLE; }
    uint32_t setsAllocated() const { return allocated_; }
    uint32_t capacity() const { return maxSets_; }

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
    uint32_t maxSets_ = 0;
    uint32_t allocated_ = 0;
};

class DescriptorWriter {
public:
    DescriptorWriter& storageImage(VkDescriptorSet set, uint32_t binding, VkImageView view);
    DescriptorWriter& storageBuffer(VkDescriptorSet set, uint32_t binding, VkBuffer buffer,
                                    VkDeviceSize offset = 0, VkDeviceSize range = VK_WHOLE_SIZE);
    DescriptorWriter& accelerationStructure(VkDescriptorSet set, uint32_t binding, VkAccelerationStructureKHR as);

    // Applies every queued write and clears the queue. Returns the number of
    // writes applied; null sets or resources are dropped with a warning.
    size_t flush(VkDevice device);

    size_t pending() const { return writes_.size(); }

private:
    VkWriteDescriptorSet& push(VkDescriptorSet set, uint32_t binding, VkDescriptorType type);

    std::vector<VkWriteDescriptorSet> writes_;
    // Deques keep element addresses stable while writes_ points into them.
    std::deque<VkDescriptorImageInfo> images_;
    std::deque<VkDescriptorBufferInfo> buffers_;
    std::deque<VkAccelerationStructureKHR> structures_;
    std::deque<VkWriteDescriptorSetAccelerationStructureKHR> structureInfos_;
    size_t dropped_ = 0;
};

}
