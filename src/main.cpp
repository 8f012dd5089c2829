#include <array>
#include <cmath>
#include <vector>

#include <glm/glm.hpp>
#include <spdlog/spdlog.h>

#include "app/App.h"
#include "core/Descriptors.h"
#include "render/AccelerationStructure.h"
#include "render/VulkanUtils.h"

namespace {

// Single triangle traced with one ray query per pixel from a compute shader.
class RtTriangleExample final : public app::Example {
public:
    const char* name() const override { return "rt_triangle"; }

    platform::DeviceRequirements requirements() const override {
        platform::DeviceRequirements req;
        req.rayQuery = true;
        return req;
    }

    bool init(app::AppContext& ctx) override {
        struct Vertex { float x, y, z; };
        const std::array<Vertex, 3> vertices = {
            Vertex{-0.5f, -0.25f, 0.0f},
            Vertex{+0.5f, -0.25f, 0.0f},
            Vertex{0.0f, +0.5f, 0.0f},
        };
        const std::array<uint32_t, 3> indices = {0, 1, 2};

        const VkBufferUsageFlags inputUsage = VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_BUILD_INPUT_READ_ONLY_BIT_KHR |
                                              VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
        if (ctx.upload.createDeviceBuffer(vertices.data(), sizeof(vertices), inputUsage, vertexBuffer_) != core::AllocationError::None ||
            ctx.upload.createDeviceBuffer(indices.data(), sizeof(indices), inputUsage, indexBuffer_) != core::AllocationError::None) {
            spdlog::error("rt_triangle: geometry upload failed");
            return false;
        }

        if (!builder_.init(ctx.vk, ctx.upload)) return false;

        render::GeometryDescriptor geom;
        geom.vertices = render::BufferRef::from(vertexBuffer_);
        geom.indices = render::BufferRef::from(indexBuffer_);
        geom.vertexStride = sizeof(Vertex);
        geom.vertexCount = static_cast<uint32_t>(vertices.size());
        geom.indexCount = static_cast<uint32_t>(indices.size());

        render::Blas blas;
        core::BuildError err = builder_.buildBlas({geom}, blas);
        if (err != core::BuildError::None) {
            spdlog::error("rt_triangle: BLAS build failed: {}", core::to_string(err));
            return false;
        }
        render::Instance instance;
        instance.blas = registry_.add(std::move(blas));
        err = builder_.buildTlas({instance}, registry_, tlas_);
        if (err != core::BuildError::None) {
            spdlog::error("rt_triangle: TLAS build failed: {}", core::to_string(err));
            return false;
        }

        VkDevice device = ctx.vk.device();
        setLayout_ = render::vkutil::createDescriptorSetLayout(device, {
            {0, VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, VK_SHADER_STAGE_COMPUTE_BIT},
            {1, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, VK_SHADER_STAGE_COMPUTE_BIT},
        });
        if (!setLayout_) return false;
        if (!render::vkutil::createComputePipeline(device, render::vkutil::shaderPath("rt_triangle.comp.spv"),
                                                   setLayout_, sizeof(TracePush), pipelineLayout_, pipeline_)) {
            return false;
        }

        const uint32_t slots = ctx.frames.framesInFlight();
        if (!descriptorPool_.init(device, {
                {VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR, slots},
                {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, slots},
            }, slots)) {
            return false;
        }
        if (!descriptorPool_.allocate(setLayout_, slots, sets_)) return false;
        writeTargets(ctx, /*withTlas=*/true);
        return true;
    }

    void update(float dt) override { time_ += dt; }

    void recordFrame(app::AppContext& ctx, const render::FrameContext& frame, core::FrameGraph& graph) override {
        ctx.frames.trackUse(frame, tlas_.backing.id);
        ctx.frames.trackUse(frame, tlas_.instances.id);

        TracePush push{};
        push.origin = glm::vec4(0.35f * std::sin(time_), 0.0f, 2.0f, 0.0f);
        push.extent = glm::uvec2(frame.extent.width, frame.extent.height);
        push.fovTan = std::tan(glm::radians(30.0f));

        VkDescriptorSet set = sets_[frame.slot];
        const bool added = graph.addPass("rt-triangle", VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                                         [this, set, push](VkCommandBuffer cmd) {
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline_);
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipelineLayout_, 0, 1, &set, 0, nullptr);
            vkCmdPushConstants(cmd, pipelineLayout_, VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(push), &push);
            vkCmdDispatch(cmd, (push.extent.x + 7) / 8, (push.extent.y + 7) / 8, 1);
        });
        if (!added) spdlog::warn("rt-triangle: frame {} recorded without the trace pass", frame.frameNumber);
    }

    bool onSwapchainRebuilt(app::AppContext& ctx) override {
        writeTargets(ctx, /*withTlas=*/false);
        return true;
    }

    void shutdown(app::AppContext& ctx) override {
        VkDevice device = ctx.vk.device();
        descriptorPool_.shutdown();
        sets_.clear();
        if (pipeline_) vkDestroyPipeline(device, pipeline_, nullptr);
        if (pipelineLayout_) vkDestroyPipelineLayout(device, pipelineLayout_, nullptr);
        if (setLayout_) vkDestroyDescriptorSetLayout(device, setLayout_, nullptr);
        pipeline_ = VK_NULL_HANDLE;
        pipelineLayout_ = VK_NULL_HANDLE;
        setLayout_ = VK_NULL_HANDLE;

        if (!builder_.destroy(tlas_, registry_)) spdlog::error("rt_triangle: TLAS release refused");
        if (!registry_.clear(builder_)) spdlog::error("rt_triangle: BLAS release refused");
        if (!ctx.vk.destroy(vertexBuffer_)) spdlog::error("rt_triangle: vertex buffer release refused");
        if (!ctx.vk.destroy(indexBuffer_)) spdlog::error("rt_triangle: index buffer release refused");
    }

private:
    struct TracePush {
        glm::vec4 origin;
        glm::uvec2 extent;
        float fovTan;
        float pad;
    };

    // One set per frame slot; each slot traces into its own render target.
    void writeTargets(app::AppContext& ctx, bool withTlas) {
        core::DescriptorWriter writer;
        for (uint32_t i = 0; i < sets_.size(); ++i) {
            if (withTlas) writer.accelerationStructure(sets_[i], 0, tlas_.handle);
            writer.storageImage(sets_[i], 1, ctx.targets.target(i).view);
        }
        writer.flush(ctx.vk.device());
    }

    core::AllocatedBuffer vertexBuffer_;
    core::AllocatedBuffer indexBuffer_;
    render::AccelerationStructureBuilder builder_;
    render::BlasRegistry registry_;
    render::Tlas tlas_;
    core::DescriptorPool descriptorPool_;
    std::vector<VkDescriptorSet> sets_;
    VkDescriptorSetLayout setLayout_ = VK_NULL_HANDLE;
    VkPipelineLayout pipelineLayout_ = VK_NULL_HANDLE;
    VkPipeline pipeline_ = VK_NULL_HANDLE;
    float time_ = 0.0f;
};

} // namespace

int main(int argc, char** argv) {
    RtTriangleExample example;
    app::App app;
    return app.run(example, argc, argv);
}
