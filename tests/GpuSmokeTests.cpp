// End-to-end checks on a real device: allocation, upload, BLAS/TLAS builds and
// a ray query dispatch, and a trace through a ray tracing pipeline where the
// device has one. Exits 77 (skipped) when no suitable device is present.
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Descriptors.h"
#include "core/Upload.h"
#include "platform/VulkanContext.h"
#include "render/AccelerationStructure.h"
#include "render/RayTracingPipeline.h"
#include "render/VulkanUtils.h"

namespace {

constexpr int kSkip = 77;

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "GpuSmokeTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

int skip(const char* why) {
    std::fprintf(stderr, "GpuSmokeTests skipped: %s\n", why);
    return kSkip;
}

} // namespace

#define CHECK(cond, msg, ...) \
    do { \
        if (!(cond)) { \
            logFailureFmt(__FILE__, __LINE__, msg, ##__VA_ARGS__); \
            success = false; \
        } \
    } while (0)

int main() {
    spdlog::set_level(spdlog::level::warn);
    bool success = true;

    const std::string queryShaderPath = render::vkutil::shaderPath("ray_query_check.comp.spv");
    if (render::vkutil::readSpirv(queryShaderPath).empty()) return skip("ray_query_check.comp.spv not built");

    platform::VulkanContext vk;
    if (!vk.initInstance({}, false)) {
        vk.shutdown();
        return skip("no Vulkan loader/instance");
    }
    platform::DeviceRequirements req;
    req.rayQuery = true;
    req.rayTracingPipeline = true;
    req.lifetimeChecks = true;
    if (!vk.initDevice(VK_NULL_HANDLE, req)) {
        vk.shutdown();
        return skip("no device with acceleration structures and ray queries");
    }
    core::UploadContext upload;
    CHECK(upload.init(vk), "upload context init");

    // Allocation requests are validated before reaching VMA
    {
        core::AllocatedBuffer b;
        CHECK(vk.createBuffer(0, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, b) ==
                  core::AllocationError::InvalidRequest, "zero-size buffer rejected");
        CHECK(!b.valid(), "rejected buffer stays empty");
        core::AllocatedImage img;
        CHECK(vk.createImage(VkExtent2D{0, 4}, VK_FORMAT_R8G8B8A8_UNORM, VK_IMAGE_USAGE_STORAGE_BIT,
                             VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, img) == core::AllocationError::InvalidRequest,
              "zero-extent image rejected");
    }

    // Device-local upload round trip through a host-visible readback buffer
    {
        std::vector<uint32_t> src(4096);
        for (size_t i = 0; i < src.size(); ++i) src[i] = static_cast<uint32_t>(i * 2654435761u);
        const VkDeviceSize bytes = src.size() * sizeof(uint32_t);
        core::AllocatedBuffer gpu;
        core::AllocationError err = upload.createDeviceBuffer(src.data(), bytes,
                                                              VK_BUFFER_USAGE_TRANSFER_SRC_BIT, gpu);
        CHECK(err == core::AllocationError::None, "device buffer upload (%s)", core::to_string(err).data());
        core::AllocatedBuffer readback;
        err = vk.createBuffer(bytes, VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                              VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, readback);
        CHECK(err == core::AllocationError::None && readback.mapped, "readback buffer is mapped");
        if (gpu.valid() && readback.valid()) {
            const bool ok = upload.submitImmediate([&](VkCommandBuffer cmd) {
                VkBufferCopy region{0, 0, bytes};
                vkCmdCopyBuffer(cmd, gpu.buffer, readback.buffer, 1, &region);
            });
            CHECK(ok, "copy submission");
            CHECK(ok && std::memcmp(readback.mapped, src.data(), bytes) == 0, "uploaded bytes read back intact");
        }

        // Released while a frame still uses it: refused, then allowed once that frame retires.
        vk.lifetimeTracker().markInUse(gpu.id, 7);
        CHECK(!vk.destroy(gpu), "release refused while in flight");
        CHECK(gpu.valid(), "refused release leaves the buffer intact");
        vk.lifetimeTracker().markCompleted(7);
        CHECK(vk.destroy(gpu), "release allowed after completion");
        CHECK(vk.destroy(readback), "readback released");
    }

    // Acceleration structures and a ray query check
    render::AccelerationStructureBuilder builder;
    CHECK(builder.init(vk, upload), "builder init");
    render::BlasRegistry registry;
    render::Tlas tlas;
    core::AllocatedBuffer vertices, indices, results;
    {
        const float tri[9] = {-1.0f, -1.0f, 0.0f, 1.0f, -1.0f, 0.0f, 0.0f, 1.0f, 0.0f};
        const uint32_t idx[3] = {0, 1, 2};
        const VkBufferUsageFlags usage = VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_BUILD_INPUT_READ_ONLY_BIT_KHR |
                                         VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
        CHECK(upload.createDeviceBuffer(tri, sizeof(tri), usage, vertices) == core::AllocationError::None, "vertex upload");
        CHECK(upload.createDeviceBuffer(idx, sizeof(idx), usage, indices) == core::AllocationError::None, "index upload");

        render::GeometryDescriptor geom;
        geom.vertices = render::BufferRef::from(vertices);
        geom.indices = render::BufferRef::from(indices);
        geom.vertexStride = 3 * sizeof(float);
        geom.vertexCount = 3;
        geom.indexCount = 3;
        render::Blas blas;
        core::BuildError err = builder.buildBlas({geom}, blas);
        CHECK(err == core::BuildError::None, "BLAS build (%s)", core::to_string(err).data());
        CHECK(blas.valid() && blas.address != 0 && blas.primitiveCount == 1, "BLAS has an address and one triangle");
        render::BlasHandle handle = registry.add(std::move(blas));

        render::Instance inst;
        inst.blas = handle;
        inst.instanceIndex = 5;
        err = builder.buildTlas({inst}, registry, tlas);
        CHECK(err == core::BuildError::None, "TLAS build (%s)", core::to_string(err).data());
        CHECK(tlas.valid() && tlas.instanceCount == 1, "TLAS over one instance");
        CHECK(registry.referenceCount(handle) == 1, "TLAS holds a reference (%u)", registry.referenceCount(handle));
        CHECK(!registry.remove(handle, builder), "BLAS removal refused while the TLAS exists");

        CHECK(vk.createBuffer(4 * sizeof(uint32_t), VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                              VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                              results) == core::AllocationError::None, "result buffer");
    }

    if (tlas.valid() && results.valid() && results.mapped) {
        std::memset(results.mapped, 0, 4 * sizeof(uint32_t));
        VkDevice device = vk.device();
        VkDescriptorSetLayout layout = render::vkutil::createDescriptorSetLayout(device, {
            {0, VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, VK_SHADER_STAGE_COMPUTE_BIT},
            {1, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, VK_SHADER_STAGE_COMPUTE_BIT},
        });
        VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;
        VkPipeline pipeline = VK_NULL_HANDLE;
        CHECK(layout != VK_NULL_HANDLE, "descriptor set layout");
        CHECK(render::vkutil::createComputePipeline(device, queryShaderPath, layout, 0, pipelineLayout, pipeline),
              "ray query pipeline");

        core::DescriptorPool descriptors;
        CHECK(descriptors.init(device, {{VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, 1},
                                        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1}}, 1), "descriptor pool");
        std::vector<VkDescriptorSet> sets;
        CHECK(layout && descriptors.allocate(layout, 1, sets), "descriptor set");
        std::vector<VkDescriptorSet> extra;
        CHECK(!descriptors.allocate(layout, 1, extra) && extra.empty(), "pool refuses sets beyond its capacity");
        VkDescriptorSet set = sets.empty() ? VK_NULL_HANDLE : sets[0];
        if (set && pipeline) {
            core::DescriptorWriter writer;
            writer.accelerationStructure(set, 0, tlas.handle).storageBuffer(set, 1, results.buffer);
            CHECK(writer.flush(device) == 2, "both descriptors written in one update");
            const bool ok = upload.submitImmediate([&](VkCommandBuffer cmd) {
                vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline);
                vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipelineLayout, 0, 1, &set, 0, nullptr);
                vkCmdDispatch(cmd, 1, 1, 1);
                render::vkutil::memoryBarrier(cmd, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_WRITE_BIT,
                                              VK_PIPELINE_STAGE_2_HOST_BIT, VK_ACCESS_2_HOST_READ_BIT);
            });
            CHECK(ok, "ray query dispatch");
            const auto* values = static_cast<const uint32_t*>(results.mapped);
            CHECK(values[3] == 0xC0FFEEu, "ray query shader ran (sentinel 0x%x)", values[3]);
            CHECK(values[0] == 1u, "ray through the triangle hits (%u)", values[0]);
            CHECK(values[1] == 5u, "hit reports the instance custom index (%u)", values[1]);
            CHECK(values[2] == 0u, "ray beside the triangle misses (%u)", values[2]);
        }
        descriptors.shutdown();
        if (pipeline) vkDestroyPipeline(device, pipeline, nullptr);
        if (pipelineLayout) vkDestroyPipelineLayout(device, pipelineLayout, nullptr);
        if (layout) vkDestroyDescriptorSetLayout(device, layout, nullptr);
    }

    // The same scene through a ray tracing pipeline and its shader binding table
    if (vk.rayTracing().rayTracingPipeline && tlas.valid() && results.valid() && results.mapped) {
        std::memset(results.mapped, 0xAB, 4 * sizeof(uint32_t));
        VkDevice device = vk.device();
        const VkShaderStageFlags rgen = VK_SHADER_STAGE_RAYGEN_BIT_KHR;
        VkDescriptorSetLayout layout = render::vkutil::createDescriptorSetLayout(device, {
            {0, VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, rgen},
            {1, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, rgen},
        });
        VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;
        VkPipelineLayoutCreateInfo plci{};
        plci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        plci.setLayoutCount = 1;
        plci.pSetLayouts = &layout;
        CHECK(layout && vkCreatePipelineLayout(device, &plci, nullptr, &pipelineLayout) == VK_SUCCESS,
              "ray tracing pipeline layout");

        render::RayTracingPipeline rt;
        const bool built = pipelineLayout && rt.init(vk, pipelineLayout, {
            {render::vkutil::shaderPath("rt_check.rgen.spv"), render::ShaderGroupKind::RayGen},
            {render::vkutil::shaderPath("rt_check.rmiss.spv"), render::ShaderGroupKind::Miss},
            {render::vkutil::shaderPath("rt_check.rchit.spv"), render::ShaderGroupKind::ClosestHit},
        });
        CHECK(built, "ray tracing pipeline with one miss and one hit group");
        const uint32_t base = vk.rayTracing().shaderGroupBaseAlignment;
        const render::SbtLayout& sbt = rt.sbtLayout();
        CHECK(!built || (sbt.raygen.deviceAddress % base == 0 && sbt.miss.deviceAddress % base == 0 &&
                         sbt.hit.deviceAddress % base == 0),
              "table regions start on the base alignment (%u)", base);

        core::DescriptorPool descriptors;
        CHECK(descriptors.init(device, {{VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, 1},
                                        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1}}, 1), "ray tracing descriptor pool");
        std::vector<VkDescriptorSet> sets;
        CHECK(layout && descriptors.allocate(layout, 1, sets), "ray tracing descriptor set");
        VkDescriptorSet set = sets.empty() ? VK_NULL_HANDLE : sets[0];
        if (built && set) {
            core::DescriptorWriter writer;
            writer.accelerationStructure(set, 0, tlas.handle).storageBuffer(set, 1, results.buffer);
            CHECK(writer.flush(device) == 2, "ray tracing descriptors written");
            const bool ok = upload.submitImmediate([&](VkCommandBuffer cmd) {
                rt.bind(cmd);
                vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_RAY_TRACING_KHR, pipelineLayout, 0, 1, &set, 0,
                                        nullptr);
                rt.trace(cmd, 2, 1);
                render::vkutil::memoryBarrier(cmd, VK_PIPELINE_STAGE_2_RAY_TRACING_SHADER_BIT_KHR,
                                              VK_ACCESS_2_SHADER_WRITE_BIT, VK_PIPELINE_STAGE_2_HOST_BIT,
                                              VK_ACCESS_2_HOST_READ_BIT);
            });
            CHECK(ok, "trace rays submission");
            const auto* values = static_cast<const uint32_t*>(results.mapped);
            CHECK(values[0] == 6u, "closest hit reports custom index + 1 (%u)", values[0]);
            CHECK(values[1] == 0u, "miss shader runs for the ray beside the triangle (%u)", values[1]);
        }

        vk.lifetimeTracker().markInUse(rt.tableId(), 11);
        CHECK(!built || !rt.destroy(), "pipeline release refused while its table is in flight");
        vk.lifetimeTracker().markCompleted(11);
        CHECK(rt.destroy(), "pipeline released");
        descriptors.shutdown();
        if (pipelineLayout) vkDestroyPipelineLayout(device, pipelineLayout, nullptr);
        if (layout) vkDestroyDescriptorSetLayout(device, layout, nullptr);
    }

    CHECK(builder.destroy(tlas, registry), "TLAS destroyed");
    CHECK(registry.clear(builder), "BLAS released once no TLAS references it");
    CHECK(registry.size() == 0, "registry empty (%zu)", registry.size());
    CHECK(vk.destroy(vertices), "vertex buffer released");
    CHECK(vk.destroy(indices), "index buffer released");
    CHECK(vk.destroy(results), "result buffer released");
    upload.shutdown();
    CHECK(vk.allocator().liveBuffers() == 0 && vk.allocator().liveImages() == 0,
          "no leaked allocations (buffers=%u images=%u)", vk.allocator().liveBuffers(), vk.allocator().liveImages());
    vk.shutdown();

    return success ? 0 : 1;
}
