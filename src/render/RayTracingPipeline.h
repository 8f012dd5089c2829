#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <volk.h>

#include "core/GpuAllocator.h"

namespace platform { class VulkanContext; }

namespace render {

enum class ShaderGroupKind : uint8_t { RayGen, Miss, ClosestHit };

struct RayTracingShader {
    std::string spirvPath;
    ShaderGroupKind kind = ShaderGroupKind::RayGen;
};

// Device limits the table layout depends on.
struct SbtProperties {
    uint32_t handleSize = 0;
    uint32_t handleAlignment = 0;
    uint32_t baseAlignment = 0;
};

// Shader binding table layout. Region deviceAddress fields hold byte offsets
// from the start of the table until the table is placed in a buffer.
struct SbtLayout {
    VkDeviceSize handleStride = 0;
    VkStridedDeviceAddressRegionKHR raygen{};
    VkStridedDeviceAddressRegionKHR miss{};
    VkStridedDeviceAddressRegionKHR hit{};
    VkStridedDeviceAddressRegionKHR callable{};
    VkDeviceSize size = 0;
    uint32_t missCount = 0;
    uint32_t hitCount = 0;

    bool valid() const { return size != 0; }
    uint32_t groupCount() const { return 1 + missCount + hitCount; }
};

// One raygen record, then the miss records, then the hit records. Each region
// starts on baseAlignment; records inside a region are handleStride apart.
// Returns an invalid layout for zero or non-power-of-two limits.
SbtLayout computeSbtLayout(const SbtProperties& props, uint32_t missCount, uint32_t hitCount);

// Scatters group handles (group order, handleSize bytes each) into the table.
// Empty when the handle blob does not match the layout.
std::vector<uint8_t> packShaderBindingTable(const SbtLayout& layout,
                                            const SbtProperties& props,
                                            const std::vector<uint8_t>& handles);

// Groups must be listed raygen, miss..., closest hit...; exactly one raygen.
bool validateShaderGroups(const std::vector<RayTracingShader>& shaders);

// Ray tracing pipeline with its shader binding table in a host-visible buffer.
class RayTracingPipeline {
public:
    bool init(platform::VulkanContext& vk,
              VkPipelineLayout layout,
              const std::vector<RayTracingShader>& shaders,
              uint32_t maxRecursionDepth = 1);
    // False while the table buffer is still referenced by an unfinished frame.
    bool destroy();

    void bind(VkCommandBuffer cmd) const;
    void trace(VkCommandBuffer cmd, uint32_t width, uint32_t height, uint32_t depth = 1) const;

    bool ready() const { return pipeline_ != VK_NULL_HANDLE; }
    VkPipeline pipeline() const { return pipeline_; }
    const SbtLayout& sbtLayout() const { return regions_; }
    core::ResourceId tableId() const { return table_.id; }

private:
    bool createPipeline(VkPipelineLayout layout,
                        const std::vector<RayTracingShader>& shaders,
                        uint32_t maxRecursionDepth);
    bool createTable(const SbtProperties& props, uint32_t missCount, uint32_t hitCount);

    platform::VulkanContext* vk_ = nullptr;
    VkPipeline pipeline_ = VK_NULL_HANDLE;
    core::AllocatedBuffer table_{};
    SbtLayout regions_{}; // addresses resolved against table_
};

} // namespace render
