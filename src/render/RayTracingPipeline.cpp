#include "RayTracingPipeline.h"

#include <cstring>

#include <spdlog/spdlog.h>

#include "platform/VulkanContext.h"
#include "render/VulkanUtils.h"

namespace render {

namespace {

bool powerOfTwo(uint32_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

VkShaderStageFlagBits stageFor(ShaderGroupKind kind) {
    switch (kind) {
        case ShaderGroupKind::RayGen: return VK_SHADER_STAGE_RAYGEN_BIT_KHR;
        case ShaderGroupKind::Miss: return VK_SHADER_STAGE_MISS_BIT_KHR;
        case ShaderGroupKind::ClosestHit: return VK_SHADER_STAGE_CLOSEST_HIT_BIT_KHR;
    }
    return VK_SHADER_STAGE_RAYGEN_BIT_KHR;
}

} // namespace

SbtLayout computeSbtLayout(const SbtProperties& props, uint32_t missCount, uint32_t hitCount) {
    if (props.handleSize == 0 || !powerOfTwo(props.handleAlignment) || !powerOfTwo(props.baseAlignment)) {
        return {};
    }
    SbtLayout l;
    l.missCount = missCount;
    l.hitCount = hitCount;
    l.handleStride = vkutil::alignUp(props.handleSize, props.handleAlignment);

    // The raygen region's size must equal its stride.
    l.raygen.deviceAddress = 0;
    l.raygen.stride = vkutil::alignUp(l.handleStride, props.baseAlignment);
    l.raygen.size = l.raygen.stride;

    VkDeviceSize offset = l.raygen.size;
    if (missCount > 0) {
        l.miss.deviceAddress = offset;
        l.miss.stride = l.handleStride;
        l.miss.size = vkutil::alignUp(missCount * l.handleStride, props.baseAlignment);
        offset += l.miss.size;
    }
    if (hitCount > 0) {
        l.hit.deviceAddress = offset;
        l.hit.stride = l.handleStride;
        l.hit.size = vkutil::alignUp(hitCount * l.handleStride, props.baseAlignment);
        offset += l.hit.size;
    }
    l.size = offset;
    return l;
}

std::vector<uint8_t> packShaderBindingTable(const SbtLayout& layout,
                                            const SbtProperties& props,
                                            const std::vector<uint8_t>& handles) {
    const size_t expected = static_cast<size_t>(layout.groupCount()) * props.handleSize;
    if (!layout.valid() || props.handleSize == 0 || handles.size() != expected) {
        spdlog::error("SBT: {} handle bytes for {} groups of {} bytes", handles.size(), layout.groupCount(),
                      props.handleSize);
        return {};
    }

    std::vector<uint8_t> table(layout.size, 0);
    const uint8_t* src = handles.data();
    auto put = [&](VkDeviceSize offset) {
        std::memcpy(table.data() + offset, src, props.handleSize);
        src += props.handleSize;
    };
    put(layout.raygen.deviceAddress);
    for (uint32_t i = 0; i < layout.missCount; ++i) put(layout.miss.deviceAddress + i * layout.handleStride);
    for (uint32_t i = 0; i < layout.hitCount; ++i) put(layout.hit.deviceAddress + i * layout.handleStride);
    return table;
}

bool validateShaderGroups(const std::vector<RayTracingShader>& shaders) {
    if (shaders.empty() || shaders.front().kind != ShaderGroupKind::RayGen) {
        spdlog::error("RT pipeline: the first shader group must be the raygen shader");
        return false;
    }
    for (size_t i = 1; i < shaders.size(); ++i) {
        if (shaders[i].kind == ShaderGroupKind::RayGen) {
            spdlog::error("RT pipeline: more than one raygen shader (group {})", i);
            return false;
        }
        if (shaders[i].kind < shaders[i - 1].kind) {
            spdlog::error("RT pipeline: group {} is out of order (raygen, miss, then hit)", i);
            return false;
        }
    }
    return true;
}

bool RayTracingPipeline::init(platform::VulkanContext& vk,
                              VkPipelineLayout layout,
                              const std::vector<RayTracingShader>& shaders,
                              uint32_t maxRecursionDepth) {
    const platform::RayTracingProperties& rt = vk.rayTracing();
    if (!rt.rayTracingPipeline) {
        spdlog::error("RT pipeline requested but the device was created without ray tracing pipelines");
        return false;
    }
    if (!validateShaderGroups(shaders)) return false;
    if (maxRecursionDepth == 0 || maxRecursionDepth > rt.maxRayRecursionDepth) {
        spdlog::error("RT pipeline: recursion depth {} outside [1, {}]", maxRecursionDepth, rt.maxRayRecursionDepth);
        return false;
    }
    vk_ = &vk;

    uint32_t missCount = 0;
    uint32_t hitCount = 0;
    for (const auto& s : shaders) {
        if (s.kind == ShaderGroupKind::Miss) ++missCount;
        if (s.kind == ShaderGroupKind::ClosestHit) ++hitCount;
    }

    if (!createPipeline(layout, shaders, maxRecursionDepth)) return false;
    SbtProperties props{rt.shaderGroupHandleSize, rt.shaderGroupHandleAlignment, rt.shaderGroupBaseAlignment};
    if (!createTable(props, missCount, hitCount)) {
        vkDestroyPipeline(vk_->device(), pipeline_, nullptr);
        pipeline_ = VK_NULL_HANDLE;
        return false;
    }
    spdlog::debug("RT pipeline: {} groups, SBT {} bytes (raygen {} / miss {} / hit {})",
                  regions_.groupCount(), static_cast<uint64_t>(regions_.size),
                  static_cast<uint64_t>(regions_.raygen.size), static_cast<uint64_t>(regions_.miss.size),
                  static_cast<uint64_t>(regions_.hit.size));
    return true;
}

bool RayTracingPipeline::createPipeline(VkPipelineLayout layout,
                                        const std::vector<RayTracingShader>& shaders,
                                        uint32_t maxRecursionDepth) {
    VkDevice device = vk_->device();
    std::vector<VkShaderModule> modules;
    std::vector<VkPipelineShaderStageCreateInfo> stages;
    std::vector<VkRayTracingShaderGroupCreateInfoKHR> groups;
    auto releaseModules = [&] {
        for (VkShaderModule m : modules) vkDestroyShaderModule(device, m, nullptr);
    };

    for (const auto& shader : shaders) {
        VkShaderModule module = vkutil::createShaderModule(device, vkutil::readSpirv(shader.spirvPath));
        if (!module) {
            spdlog::error("RT pipeline: cannot load {}", shader.spirvPath);
            releaseModules();
            return false;
        }
        const uint32_t index = static_cast<uint32_t>(modules.size());
        modules.push_back(module);

        VkPipelineShaderStageCreateInfo stage{};
        stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stage.stage = stageFor(shader.kind);
        stage.module = module;
        stage.pName = "main";
        stages.push_back(stage);

        VkRayTracingShaderGroupCreateInfoKHR group{};
        group.sType = VK_STRUCTURE_TYPE_RAY_TRACING_SHADER_GROUP_CREATE_INFO_KHR;
        group.type = VK_RAY_TRACING_SHADER_GROUP_TYPE_GENERAL_KHR;
        group.generalShader = VK_SHADER_UNUSED_KHR;
        group.closestHitShader = VK_SHADER_UNUSED_KHR;
        group.anyHitShader = VK_SHADER_UNUSED_KHR;
        group.intersectionShader = VK_SHADER_UNUSED_KHR;
        if (shader.kind == ShaderGroupKind::ClosestHit) {
            group.type = VK_RAY_TRACING_SHADER_GROUP_TYPE_TRIANGLES_HIT_GROUP_KHR;
            group.closestHitShader = index;
        } else {
            group.generalShader = index;
        }
        groups.push_back(group);
    }

    VkRayTracingPipelineCreateInfoKHR ci{};
    ci.sType = VK_STRUCTURE_TYPE_RAY_TRACING_PIPELINE_CREATE_INFO_KHR;
    ci.stageCount = static_cast<uint32_t>(stages.size());
    ci.pStages = stages.data();
    ci.groupCount = static_cast<uint32_t>(groups.size());
    ci.pGroups = groups.data();
    ci.maxPipelineRayRecursionDepth = maxRecursionDepth;
    ci.layout = layout;
    VkResult res = vkCreateRayTracingPipelinesKHR(device, VK_NULL_HANDLE, VK_NULL_HANDLE, 1, &ci, nullptr, &pipeline_);
    releaseModules();
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateRayTracingPipelinesKHR failed ({})", static_cast<int>(res));
        pipeline_ = VK_NULL_HANDLE;
        return false;
    }
    return true;
}

bool RayTracingPipeline::createTable(const SbtProperties& props, uint32_t missCount, uint32_t hitCount) {
    SbtLayout layout = computeSbtLayout(props, missCount, hitCount);
    if (!layout.valid()) {
        spdlog::error("SBT: unusable device limits (handle {} / align {} / base {})",
                      props.handleSize, props.handleAlignment, props.baseAlignment);
        return false;
    }

    std::vector<uint8_t> handles(static_cast<size_t>(layout.groupCount()) * props.handleSize);
    VkResult res = vkGetRayTracingShaderGroupHandlesKHR(vk_->device(), pipeline_, 0, layout.groupCount(),
                                                        handles.size(), handles.data());
    if (res != VK_SUCCESS) {
        spdlog::error("vkGetRayTracingShaderGroupHandlesKHR failed ({})", static_cast<int>(res));
        return false;
    }
    std::vector<uint8_t> packed = packShaderBindingTable(layout, props, handles);
    if (packed.empty()) return false;

    // Buffer addresses are only guaranteed the buffer's own alignment; pad so
    // the table start can be moved up to baseAlignment.
    core::AllocationError err = vk_->createBuffer(
        layout.size + props.baseAlignment,
        VK_BUFFER_USAGE_SHADER_BINDING_TABLE_BIT_KHR | VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, table_);
    if (err != core::AllocationError::None || !table_.mapped) {
        spdlog::error("SBT buffer allocation failed ({})", core::to_string(err));
        if (table_.valid() && !vk_->destroy(table_)) spdlog::warn("SBT buffer release deferred");
        return false;
    }
    const VkDeviceAddress base = vkutil::alignUp(table_.address, props.baseAlignment);
    std::memcpy(static_cast<uint8_t*>(table_.mapped) + (base - table_.address), packed.data(), packed.size());

    regions_ = layout;
    regions_.raygen.deviceAddress = base + layout.raygen.deviceAddress;
    if (missCount > 0) regions_.miss.deviceAddress = base + layout.miss.deviceAddress;
    if (hitCount > 0) regions_.hit.deviceAddress = base + layout.hit.deviceAddress;
    return true;
}

void RayTracingPipeline::bind(VkCommandBuffer cmd) const {
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_RAY_TRACING_KHR, pipeline_);
}

void RayTracingPipeline::trace(VkCommandBuffer cmd, uint32_t width, uint32_t height, uint32_t depth) const {
    vkCmdTraceRaysKHR(cmd, &regions_.raygen, &regions_.miss, &regions_.hit, &regions_.callable,
                      width, height, depth);
}

bool RayTracingPipeline::destroy() {
    if (!vk_) return true;
    if (table_.valid() && !vk_->destroy(table_)) return false;
    if (pipeline_) vkDestroyPipeline(vk_->device(), pipeline_, nullptr);
    pipeline_ = VK_NULL_HANDLE;
    regions_ = SbtLayout{};
    vk_ = nullptr;
    return true;
}

} // namespace render
