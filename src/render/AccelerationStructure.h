#pragma once

#include <cstdint>
#include <vector>

#include <volk.h>
#include <glm/glm.hpp>

#include "core/Errors.h"
#include "core/GpuAllocator.h"

namespace platform { class VulkanContext; }
namespace core { class UploadContext; }

namespace render {

// Non-owning view of a geometry buffer.
struct BufferRef {
    VkBuffer buffer = VK_NULL_HANDLE;
    VkDeviceAddress address = 0;
    VkDeviceSize size = 0;

    static BufferRef from(const core::AllocatedBuffer& b) { return BufferRef{b.buffer, b.address, b.size}; }
};

struct GeometryDescriptor {
    BufferRef vertices{};
    BufferRef indices{};
    VkDeviceSize vertexStride = 0;
    uint32_t vertexCount = 0;
    uint32_t indexCount = 0;
    VkFormat vertexFormat = VK_FORMAT_R32G32B32_SFLOAT;
    VkIndexType indexType = VK_INDEX_TYPE_UINT32;
    VkGeometryFlagsKHR flags = VK_GEOMETRY_OPAQUE_BIT_KHR;
};

// Slot index plus generation; a handle outliving its BLAS no longer resolves.
struct BlasHandle {
    uint32_t index = UINT32_MAX;
    uint32_t generation = 0;

    bool valid() const { return index != UINT32_MAX; }
    bool operator==(const BlasHandle&) const = default;
};

struct Blas {
    VkAccelerationStructureKHR handle = VK_NULL_HANDLE;
    core::AllocatedBuffer backing{};
    VkDeviceAddress address = 0;
    uint32_t geometryCount = 0;
    uint32_t primitiveCount = 0;

    bool valid() const { return handle != VK_NULL_HANDLE; }
};

struct Tlas {
    VkAccelerationStructureKHR handle = VK_NULL_HANDLE;
    core::AllocatedBuffer backing{};
    core::AllocatedBuffer instances{}; // kept for refit/rebuild
    VkDeviceAddress address = 0;
    std::vector<BlasHandle> referenced;
    uint32_t instanceCount = 0;

    bool valid() const { return handle != VK_NULL_HANDLE; }
};

struct Instance {
    BlasHandle blas{};
    float transform[3][4] = {
        {1.0f, 0.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f, 0.0f},
        {0.0f, 0.0f, 1.0f, 0.0f},
    };
    uint32_t instanceIndex = 0; // 24 bits, gl_InstanceCustomIndexEXT / rayQueryGetIntersectionInstanceCustomIndexEXT
    uint8_t mask = 0xFF;
    uint32_t sbtRecordOffset = 0; // 24 bits
    VkGeometryInstanceFlagsKHR flags = VK_GEOMETRY_INSTANCE_TRIANGLE_FACING_CULL_DISABLE_BIT_KHR;

    // Top three rows of a column-major affine matrix.
    void setTransform(const glm::mat4& m);
};

constexpr uint32_t kMaxInstanceField = 0xFFFFFFu;

// Bytes of one vertex position for the formats usable as AS build input; 0 otherwise.
uint32_t vertexFormatSize(VkFormat format);
// 2 or 4; 0 for index types the builder does not accept.
uint32_t indexTypeSize(VkIndexType type);

core::BuildError validateGeometries(const std::vector<GeometryDescriptor>& geometries);
core::BuildError validateInstances(const std::vector<Instance>& instances);

VkAccelerationStructureInstanceKHR packInstance(const Instance& instance, VkDeviceAddress blasAddress);

class AccelerationStructureBuilder;

// Owns every BLAS of a scene. TLAS builds resolve instance handles here and
// hold a reference on each until the TLAS is destroyed.
class BlasRegistry {
public:
    BlasHandle add(Blas&& blas);
    const Blas* find(BlasHandle handle) const;
    bool contains(BlasHandle handle) const { return find(handle) != nullptr; }
    uint32_t referenceCount(BlasHandle handle) const;

    // Refused while any TLAS references the handle, or when the handle is stale.
    bool remove(BlasHandle handle, AccelerationStructureBuilder& builder);
    // Removes everything unreferenced; false if anything had to stay.
    bool clear(AccelerationStructureBuilder& builder);

    // Held by each TLAS built over the handle; stale handles are ignored.
    void addReference(BlasHandle handle);
    void releaseReference(BlasHandle handle);

    size_t size() const { return live_; }

private:
    struct Entry {
        Blas blas{};
        uint32_t generation = 0;
        uint32_t references = 0;
        bool live = false;
    };
    std::vector<Entry> entries_;
    std::vector<uint32_t> freeSlots_;
    size_t live_ = 0;
};

// Acceleration Structure Builder. Inputs are validated before any device call;
// builds go through a one-time fenced submission, so results are usable as soon
// as the call returns.
class AccelerationStructureBuilder {
public:
    bool init(platform::VulkanContext& vk, core::UploadContext& upload);
    bool ready() const;

    core::BuildError buildBlas(const std::vector<GeometryDescriptor>& geometries, Blas& out);
    core::BuildError buildTlas(const std::vector<Instance>& instances, BlasRegistry& registry, Tlas& out);

    // Structure first, then its backing buffer. False when the backing is still in flight.
    bool destroy(Blas& blas);
    bool destroy(Tlas& tlas, BlasRegistry& registry);

    void setBuildFlags(VkBuildAccelerationStructureFlagsKHR flags) { buildFlags_ = flags; }

private:
    core::BuildError createStructure(VkAccelerationStructureTypeKHR type,
                                     VkDeviceSize size,
                                     core::AllocatedBuffer& backing,
                                     VkAccelerationStructureKHR& handle);
    core::BuildError submitBuild(VkAccelerationStructureBuildGeometryInfoKHR& info,
                                 const VkAccelerationStructureBuildRangeInfoKHR* ranges,
                                 VkDeviceSize scratchSize);
    VkDeviceAddress structureAddress(VkAccelerationStructureKHR handle) const;
    void releaseStructure(VkAccelerationStructureKHR& handle, core::AllocatedBuffer& backing);

    platform::VulkanContext* vk_ = nullptr;
    core::UploadContext* upload_ = nullptr;
    VkBuildAccelerationStructureFlagsKHR buildFlags_ = VK_BUILD_ACCELERATION_STRUCTURE_PREFER_FAST_TRACE_BIT_KHR;
};

} // namespace render
