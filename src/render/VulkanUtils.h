#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <volk.h>

namespace render::vkutil {

// Round `value` up to a multiple of `alignment` (power of two or zero).
inline VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
    if (alignment == 0) return value;
    return (value + alignment - 1) & ~(alignment - 1);
}

// Synchronization2 image layout transition on the colour aspect of mip 0 / layer 0.
void imageBarrier(VkCommandBuffer cmd,
                  VkImage image,
                  VkImageLayout oldLayout,
                  VkImageLayout newLayout,
                  VkPipelineStageFlags2 srcStage,
                  VkAccessFlags2 srcAccess,
                  VkPipelineStageFlags2 dstStage,
                  VkAccessFlags2 dstAccess);

void memoryBarrier(VkCommandBuffer cmd,
                   VkPipelineStageFlags2 srcStage,
                   VkAccessFlags2 srcAccess,
                   VkPipelineStageFlags2 dstStage,
                   VkAccessFlags2 dstAccess);

// Read a SPIR-V binary. Empty on failure (missing file or size not a multiple of 4).
std::vector<uint32_t> readSpirv(const std::string& path);
VkShaderModule createShaderModule(VkDevice device, const std::vector<uint32_t>& code);

// Resolve a compiled shader by file name: $VKBASE_SHADER_DIR, then the build-time directory.
std::string shaderPath(const std::string& name);

struct DescriptorBinding {
    uint32_t binding = 0;
    VkDescriptorType type = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    VkShaderStageFlags stages = VK_SHADER_STAGE_COMPUTE_BIT;
};
VkDescriptorSetLayout createDescriptorSetLayout(VkDevice device, const std::vector<DescriptorBinding>& bindings);

// Compute pipeline from a SPIR-V file with an optional push-constant block.
// Returns false (and leaves outputs null) on any failure.
bool createComputePipeline(VkDevice device,
                           const std::string& spirvPath,
                           VkDescriptorSetLayout setLayout,
                           uint32_t pushConstantBytes,
                           VkPipelineLayout& outLayout,
                           VkPipeline& outPipeline);

} // namespace render::vkutil
