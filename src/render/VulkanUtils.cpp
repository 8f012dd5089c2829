#include "VulkanUtils.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <spdlog/spdlog.h>

namespace render::vkutil {

void imageBarrier(VkCommandBuffer cmd,
                  VkImage image,
                  VkImageLayout oldLayout,
                  VkImageLayout newLayout,
                  VkPipelineStageFlags2 srcStage,
                  VkAccessFlags2 srcAccess,
                  VkPipelineStageFlags2 dstStage,
                  VkAccessFlags2 dstAccess) {
    VkImageMemoryBarrier2 b{};
    b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
    b.srcStageMask = srcStage;
    b.srcAccessMask = srcAccess;
    b.dstStageMask = dstStage;
    b.dstAccessMask = dstAccess;
    b.oldLayout = oldLayout;
    b.newLayout = newLayout;
    b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.image = image;
    b.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    b.subresourceRange.levelCount = 1;
    b.subresourceRange.layerCount = 1;

    VkDependencyInfo dep{};
    dep.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dep.imageMemoryBarrierCount = 1;
    dep.pImageMemoryBarriers = &b;
    vkCmdPipelineBarrier2(cmd, &dep);
}

void memoryBarrier(VkCommandBuffer cmd,
                   VkPipelineStageFlags2 srcStage,
                   VkAccessFlags2 srcAccess,
                   VkPipelineStageFlags2 dstStage,
                   VkAccessFlags2 dstAccess) {
    VkMemoryBarrier2 b{};
    b.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
    b.srcStageMask = srcStage;
    b.srcAccessMask = srcAccess;
    b.dstStageMask = dstStage;
    b.dstAccessMask = dstAccess;

    VkDependencyInfo dep{};
    dep.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dep.memoryBarrierCount = 1;
    dep.pMemoryBarriers = &b;
    vkCmdPipelineBarrier2(cmd, &dep);
}

std::vector<uint32_t> readSpirv(const std::string& path) {
    struct FileCloser {
        void operator()(FILE* f) const noexcept { if (f) std::fclose(f); }
    };
    FILE* raw = std::fopen(path.c_str(), "rb");
    if (!raw) {
        const int err = errno;
        spdlog::error("Failed to open shader {}: {}", path, std::strerror(err));
        return {};
    }
    std::unique_ptr<FILE, FileCloser> file(raw);
    if (std::fseek(file.get(), 0, SEEK_END) != 0) {
        const int err = errno;
        spdlog::error("Failed to seek to end of shader {}: {}", path, std::strerror(err));
        return {};
    }
    long end = std::ftell(file.get());
    if (end < 0 || std::fseek(file.get(), 0, SEEK_SET) != 0) {
        const int err = errno;
        spdlog::error("Failed to size shader {}: {}", path, std::strerror(err));
        return {};
    }
    const size_t size = static_cast<size_t>(end);
    if (size == 0) {
        spdlog::error("Shader {} is empty", path);
        return {};
    }
    if ((size % sizeof(uint32_t)) != 0u) {
        spdlog::error("Shader {} has byte size {} which is not aligned to 4 bytes", path, size);
        return {};
    }
    std::vector<uint32_t> words(size / sizeof(uint32_t));
    const size_t read = std::fread(words.data(), 1, size, file.get());
    if (read != size) {
        spdlog::error("Short read on shader {} (expected {} bytes, got {})", path, size, read);
        return {};
    }
    return words;
}

VkShaderModule createShaderModule(VkDevice device, const std::vector<uint32_t>& code) {
    if (code.empty()) return VK_NULL_HANDLE;
    VkShaderModuleCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = code.size() * sizeof(uint32_t);
    ci.pCode = code.data();
    VkShaderModule module = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device, &ci, nullptr, &module) != VK_SUCCESS) {
        spdlog::error("vkCreateShaderModule failed ({} words)", code.size());
        return VK_NULL_HANDLE;
    }
    return module;
}

std::string shaderPath(const std::string& name) {
    const char* env = std::getenv("VKBASE_SHADER_DIR");
    const char* dir = (env && *env) ? env :
#ifdef VKBASE_SHADER_DIR
        VKBASE_SHADER_DIR;
#else
        "shaders";
#endif
    return std::string(dir) + "/" + name;
}

VkDescriptorSetLayout createDescriptorSetLayout(VkDevice device, const std::vector<DescriptorBinding>& bindings) {
    std::vector<VkDescriptorSetLayoutBinding> vkBindings;
    vkBindings.reserve(bindings.size());
    for (const auto& b : bindings) {
        VkDescriptorSetLayoutBinding lb{};
        lb.binding = b.binding;
        lb.descriptorType = b.type;
        lb.descriptorCount = 1;
        lb.stageFlags = b.stages;
        vkBindings.push_back(lb);
    }
    VkDescriptorSetLayoutCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    ci.bindingCount = static_cast<uint32_t>(vkBindings.size());
    ci.pBindings = vkBindings.data();
    VkDescriptorSetLayout layout = VK_NULL_HANDLE;
    if (vkCreateDescriptorSetLayout(device, &ci, nullptr, &layout) != VK_SUCCESS) {
        spdlog::error("vkCreateDescriptorSetLayout failed ({} bindings)", bindings.size());
        return VK_NULL_HANDLE;
    }
    return layout;
}

bool createComputePipeline(VkDevice device,
                           const std::string& spirvPath,
                           VkDescriptorSetLayout setLayout,
                           uint32_t pushConstantBytes,
                           VkPipelineLayout& outLayout,
                           VkPipeline& outPipeline) {
    outLayout = VK_NULL_HANDLE;
    outPipeline = VK_NULL_HANDLE;

    VkShaderModule module = createShaderModule(device, readSpirv(spirvPath));
    if (!module) return false;

    VkPipelineLayoutCreateInfo plci{};
    plci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    plci.setLayoutCount = setLayout ? 1u : 0u;
    plci.pSetLayouts = setLayout ? &setLayout : nullptr;
    VkPushConstantRange pcr{};
    pcr.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    pcr.size = pushConstantBytes;
    if (pushConstantBytes > 0) {
        plci.pushConstantRangeCount = 1;
        plci.pPushConstantRanges = &pcr;
    }
    if (vkCreatePipelineLayout(device, &plci, nullptr, &outLayout) != VK_SUCCESS) {
        spdlog::error("vkCreatePipelineLayout failed for {}", spirvPath);
        vkDestroyShaderModule(device, module, nullptr);
        outLayout = VK_NULL_HANDLE;
        return false;
    }

    VkComputePipelineCreateInfo cpci{};
    cpci.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    cpci.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    cpci.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    cpci.stage.module = module;
    cpci.stage.pName = "main";
    cpci.layout = outLayout;
    VkResult res = vkCreateComputePipelines(device, VK_NULL_HANDLE, 1, &cpci, nullptr, &outPipeline);
    vkDestroyShaderModule(device, module, nullptr);
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateComputePipelines failed for {} ({})", spirvPath, static_cast<int>(res));
        vkDestroyPipelineLayout(device, outLayout, nullptr);
        outLayout = VK_NULL_HANDLE;
        outPipeline = VK_NULL_HANDLE;
        return false;
    }
    return true;
}

} // namespace render::vkutil
