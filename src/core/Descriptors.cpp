#include "Descriptors.h"

#include <spdlog/spdlog.h>

namespace core {

bool DescriptorPool::init(VkDevice device, const std::vector<VkDescriptorPoolSize>& poolSizes, uint32_t maxSets) {
    shutdown();
    if (!device || poolSizes.empty() || maxSets == 0u) {
        spdlog::error("DescriptorPool: device, pool sizes and a set count are required");
        return false;
    }

    VkDescriptorPoolCreateInfo info{VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
    info.maxSets = maxSets;
    info.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
    info.pPoolSizes = poolSizes.data();
    VkDescriptorPool pool = VK_NULL_HANDLE;
    if (VkResult res = vkCreateDescriptorPool(device, &info, nullptr, &pool); res != VK_SUCCESS) {
        spdlog::error("vkCreateDescriptorPool failed ({})", static_cast<int>(res));
        return false;
    }
    device_ = device;
    pool_ = pool;
    maxSets_ = maxSets;
    allocated_ = 0;
    return true;
}

void DescriptorPool::shutdown() {
    if (pool_) vkDestroyDescriptorPool(device_, pool_, nullptr);
    pool_ = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
    maxSets_ = 0;
    allocated_ = 0;
}

bool DescriptorPool::allocate(VkDescriptorSetLayout layout, uint32_t count, std::vector<VkDescriptorSet>& out) {
    out.clear();
    if (!pool_ || !layout || count == 0) {
        spdlog::error("DescriptorPool::allocate: pool and layout required, count > 0");
        return false;
    }
    if (allocated_ + count > maxSets_) {
        spdlog::error("DescriptorPool exhausted: {} of {} sets used, {} requested", allocated_, maxSets_, count);
        return false;
    }
    std::vector<VkDescriptorSetLayout> layouts(count, layout);
    VkDescriptorSetAllocateInfo info{VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO};
    info.descriptorPool = pool_;
    info.descriptorSetCount = count;
    info.pSetLayouts = layouts.data();
    out.resize(count, VK_NULL_HANDLE);
    if (VkResult res = vkAllocateDescriptorSets(device_, &info, out.data()); res != VK_SUCCESS) {
        spdlog::error("vkAllocateDescriptorSets({}) failed ({})", count, static_cast<int>(res));
        out.clear();
        return false;
    }
    allocated_ += count;
    return true;
}

VkWriteDescriptorSet& DescriptorWriter::push(VkDescriptorSet set, uint32_t binding, VkDescriptorType type) {
    VkWriteDescriptorSet& w = writes_.emplace_back();
    w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    w.dstSet = set;
    w.dstBinding = binding;
    w.descriptorCount = 1;
    w.descriptorType = type;
    return w;
}

DescriptorWriter& DescriptorWriter::storageImage(VkDescriptorSet set, uint32_t binding, VkImageView view) {
    if (!set || !view) {
        ++dropped_;
        return *this;
    }
    VkDescriptorImageInfo& info = images_.emplace_back();
    info.imageView = view;
    info.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
    push(set, binding, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE).pImageInfo = &info;
    return *this;
}

DescriptorWriter& DescriptorWriter::storageBuffer(VkDescriptorSet set, uint32_t binding, VkBuffer buffer,
                                                  VkDeviceSize offset, VkDeviceSize range) {
    if (!set || !buffer) {
        ++dropped_;
        return *this;
    }
    buffers_.push_back(VkDescriptorBufferInfo{buffer, offset, range});
    push(set, binding, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER).pBufferInfo = &buffers_.back();
    return *this;
}

DescriptorWriter& DescriptorWriter::accelerationStructure(VkDescriptorSet set, uint32_t binding,
                                                          VkAccelerationStructureKHR as) {
    if (!set || !as) {
        ++dropped_;
        return *this;
    }
    structures_.push_back(as);
    VkWriteDescriptorSetAccelerationStructureKHR& info = structureInfos_.emplace_back();
    info.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET_ACCELERATION_STRUCTURE_KHR;
    info.accelerationStructureCount = 1;
    info.pAccelerationStructures = &structures_.back();
    push(set, binding, VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR).pNext = &info;
    return *this;
}

size_t DescriptorWriter::flush(VkDevice device) {
    if (dropped_ > 0) {
        spdlog::warn("DescriptorWriter: dropped {} write(s) with a null set or resource", dropped_);
    }
    const size_t applied = writes_.size();
    if (applied > 0) {
        vkUpdateDescriptorSets(device, static_cast<uint32_t>(applied), writes_.data(), 0, nullptr);
    }
    writes_.clear();
    images_.clear();
    buffers_.clear();
    structures_.clear();
    structureInfos_.clear();
    dropped_ = 0;
    return applied;
}

}
