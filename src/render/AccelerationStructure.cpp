#include "AccelerationStructure.h"

#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/Scoped.h"
#include "core/Upload.h"
#include "platform/VulkanContext.h"
#include "render/VulkanUtils.h"

namespace render {

void Instance::setTransform(const glm::mat4& m) {
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 4; ++col) {
            transform[row][col] = m[col][row];
        }
    }
}

uint32_t vertexFormatSize(VkFormat format) {
    switch (format) {
        case VK_FORMAT_R32G32B32_SFLOAT: return 12;
        case VK_FORMAT_R32G32B32A32_SFLOAT: return 16;
        case VK_FORMAT_R32G32_SFLOAT: return 8;
        case VK_FORMAT_R16G16B16A16_SFLOAT: return 8;
        case VK_FORMAT_R16G16_SFLOAT: return 4;
        case VK_FORMAT_R16G16B16A16_SNORM: return 8;
        case VK_FORMAT_R16G16_SNORM: return 4;
        default: return 0;
    }
}

uint32_t indexTypeSize(VkIndexType type) {
    switch (type) {
        case VK_INDEX_TYPE_UINT16: return 2;
        case VK_INDEX_TYPE_UINT32: return 4;
        default: return 0;
    }
}

core::BuildError validateGeometries(const std::vector<GeometryDescriptor>& geometries) {
    if (geometries.empty()) {
        spdlog::error("BLAS build rejected: no geometries");
        return core::BuildError::EmptyInput;
    }
    for (size_t i = 0; i < geometries.size(); ++i) {
        const GeometryDescriptor& g = geometries[i];
        if (g.vertexCount == 0 || g.indexCount == 0) {
            spdlog::error("BLAS geometry {} is empty ({} vertices, {} indices)", i, g.vertexCount, g.indexCount);
            return core::BuildError::EmptyInput;
        }
        const uint32_t fmtSize = vertexFormatSize(g.vertexFormat);
        const uint32_t idxSize = indexTypeSize(g.indexType);
        if (fmtSize == 0 || idxSize == 0) {
            spdlog::error("BLAS geometry {}: unsupported vertex format {} or index type {}",
                          i, static_cast<int>(g.vertexFormat), static_cast<int>(g.indexType));
            return core::BuildError::Unsupported;
        }
        if (g.vertexStride < fmtSize) {
            spdlog::error("BLAS geometry {}: stride {} smaller than vertex format ({} bytes)",
                          i, static_cast<uint64_t>(g.vertexStride), fmtSize);
            return core::BuildError::SizeMismatch;
        }
        if (g.indexCount % 3 != 0) {
            spdlog::error("BLAS geometry {}: index count {} is not a multiple of 3", i, g.indexCount);
            return core::BuildError::SizeMismatch;
        }
        const VkDeviceSize vertexBytes = g.vertexStride * static_cast<VkDeviceSize>(g.vertexCount);
        if (vertexBytes > g.vertices.size) {
            spdlog::error("BLAS geometry {}: {} vertices x {} bytes exceed vertex buffer ({} bytes)",
                          i, g.vertexCount, static_cast<uint64_t>(g.vertexStride), static_cast<uint64_t>(g.vertices.size));
            return core::BuildError::SizeMismatch;
        }
        const VkDeviceSize indexBytes = static_cast<VkDeviceSize>(g.indexCount) * idxSize;
        if (indexBytes > g.indices.size) {
            spdlog::error("BLAS geometry {}: {} indices exceed index buffer ({} bytes)",
                          i, g.indexCount, static_cast<uint64_t>(g.indices.size));
            return core::BuildError::SizeMismatch;
        }
    }
    return core::BuildError::None;
}

core::BuildError validateInstances(const std::vector<Instance>& instances) {
    if (instances.empty()) {
        spdlog::error("TLAS build rejected: no instances");
        return core::BuildError::EmptyInput;
    }
    for (size_t i = 0; i < instances.size(); ++i) {
        const Instance& inst = instances[i];
        if (inst.instanceIndex > kMaxInstanceField || inst.sbtRecordOffset > kMaxInstanceField) {
            spdlog::error("TLAS instance {}: index {} / SBT offset {} exceed 24 bits",
                          i, inst.instanceIndex, inst.sbtRecordOffset);
            return core::BuildError::SizeMismatch;
        }
        if (!inst.blas.valid()) {
            spdlog::error("TLAS instance {} has no BLAS handle", i);
            return core::BuildError::StaleReference;
        }
    }
    return core::BuildError::None;
}

VkAccelerationStructureInstanceKHR packInstance(const Instance& instance, VkDeviceAddress blasAddress) {
    VkAccelerationStructureInstanceKHR out{};
    std::memcpy(out.transform.matrix, instance.transform, sizeof(out.transform.matrix));
    out.instanceCustomIndex = instance.instanceIndex & kMaxInstanceField;
    out.mask = instance.mask;
    out.instanceShaderBindingTableRecordOffset = instance.sbtRecordOffset & kMaxInstanceField;
    out.flags = static_cast<VkGeometryInstanceFlagsKHR>(instance.flags) & 0xFFu;
    out.accelerationStructureReference = blasAddress;
    return out;
}

// --- BlasRegistry ---------------------------------------------------------

BlasHandle BlasRegistry::add(Blas&& blas) {
    uint32_t index;
    if (!freeSlots_.empty()) {
        index = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        index = static_cast<uint32_t>(entries_.size());
        entries_.emplace_back();
    }
    Entry& e = entries_[index];
    e.blas = std::move(blas);
    e.references = 0;
    e.live = true;
    ++live_;
    return BlasHandle{index, e.generation};
}

const Blas* BlasRegistry::find(BlasHandle handle) const {
    if (!handle.valid() || handle.index >= entries_.size()) return nullptr;
    const Entry& e = entries_[handle.index];
    if (!e.live || e.generation != handle.generation) return nullptr;
    return &e.blas;
}

uint32_t BlasRegistry::referenceCount(BlasHandle handle) const {
    if (!contains(handle)) return 0;
    return entries_[handle.index].references;
}

void BlasRegistry::addReference(BlasHandle handle) {
    if (contains(handle)) ++entries_[handle.index].references;
}

void BlasRegistry::releaseReference(BlasHandle handle) {
    if (!contains(handle)) return;
    Entry& e = entries_[handle.index];
    if (e.references > 0) --e.references;
}

bool BlasRegistry::remove(BlasHandle handle, AccelerationStructureBuilder& builder) {
    if (!contains(handle)) {
        spdlog::error("BLAS remove: stale handle (slot {}, generation {})", handle.index, handle.generation);
        return false;
    }
    Entry& e = entries_[handle.index];
    if (e.references > 0) {
        spdlog::error("BLAS remove refused: slot {} still referenced by {} TLAS", handle.index, e.references);
        return false;
    }
    if (!builder.destroy(e.blas)) {
        return false;
    }
    e.blas = Blas{};
    e.live = false;
    ++e.generation;
    freeSlots_.push_back(handle.index);
    --live_;
    return true;
}

bool BlasRegistry::clear(AccelerationStructureBuilder& builder) {
    bool all = true;
    for (uint32_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].live) continue;
        if (!remove(BlasHandle{i, entries_[i].generation}, builder)) all = false;
    }
    return all;
}

// --- AccelerationStructureBuilder ------------------------------------------

bool AccelerationStructureBuilder::init(platform::VulkanContext& vk, core::UploadContext& upload) {
    vk_ = &vk;
    upload_ = &upload;
    if (!ready()) {
        spdlog::error("AccelerationStructureBuilder: device has no acceleration structure support");
        return false;
    }
    spdlog::debug("AccelerationStructureBuilder ready (scratch alignment {})",
                  static_cast<uint64_t>(vk.rayTracing().minScratchOffsetAlignment));
    return true;
}

bool AccelerationStructureBuilder::ready() const {
    return vk_ != nullptr && upload_ != nullptr && upload_->valid() &&
           vk_->rayTracing().accelerationStructure &&
           vkCreateAccelerationStructureKHR != nullptr &&
           vkCmdBuildAccelerationStructuresKHR != nullptr;
}

core::BuildError AccelerationStructureBuilder::createStructure(VkAccelerationStructureTypeKHR type,
                                                               VkDeviceSize size,
                                                               core::AllocatedBuffer& backing,
                                                               VkAccelerationStructureKHR& handle) {
    core::AllocationError err = vk_->createBuffer(size,
                                                  VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_STORAGE_BIT_KHR |
                                                      VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT,
                                                  VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                                                  backing);
    if (err != core::AllocationError::None) {
        spdlog::error("AS backing buffer ({} bytes) allocation failed: {}", static_cast<uint64_t>(size), core::to_string(err));
        return core::BuildError::AllocationFailed;
    }

    VkAccelerationStructureCreateInfoKHR ci{};
    ci.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_CREATE_INFO_KHR;
    ci.type = type;
    ci.size = size;
    ci.buffer = backing.buffer;
    VkResult res = vkCreateAccelerationStructureKHR(vk_->device(), &ci, nullptr, &handle);
    if (res != VK_SUCCESS) {
        spdlog::error("vkCreateAccelerationStructureKHR failed ({})", static_cast<int>(res));
        handle = VK_NULL_HANDLE;
        if (!vk_->destroy(backing)) {
            spdlog::warn("AS backing buffer #{} kept after failed create", backing.id);
        }
        return core::BuildError::DeviceFailure;
    }
    return core::BuildError::None;
}

core::BuildError AccelerationStructureBuilder::submitBuild(VkAccelerationStructureBuildGeometryInfoKHR& info,
                                                           const VkAccelerationStructureBuildRangeInfoKHR* ranges,
                                                           VkDeviceSize scratchSize) {
    const VkDeviceSize alignment = vk_->rayTracing().minScratchOffsetAlignment;
    core::Scoped<core::AllocatedBuffer, platform::VulkanContext> scratch(*vk_);
    core::AllocationError err = vk_->createBuffer(scratchSize + alignment,
                                                  VK_BUFFER_USAGE_STORAGE_BUFFER_BIT |
                                                      VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT,
                                                  VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                                                  scratch.get());
    if (err != core::AllocationError::None || scratch->address == 0) {
        spdlog::error("AS scratch buffer ({} bytes) allocation failed: {}",
                      static_cast<uint64_t>(scratchSize), core::to_string(err));
        return core::BuildError::AllocationFailed;
    }
    info.scratchData.deviceAddress = vkutil::alignUp(scratch->address, alignment);

    const bool ok = upload_->submitImmediate([&](VkCommandBuffer cmd) {
        vkCmdBuildAccelerationStructuresKHR(cmd, 1, &info, &ranges);
        vkutil::memoryBarrier(cmd,
                              VK_PIPELINE_STAGE_2_ACCELERATION_STRUCTURE_BUILD_BIT_KHR,
                              VK_ACCESS_2_ACCELERATION_STRUCTURE_WRITE_BIT_KHR,
                              VK_PIPELINE_STAGE_2_ACCELERATION_STRUCTURE_BUILD_BIT_KHR |
                                  VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT |
                                  VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT,
                              VK_ACCESS_2_ACCELERATION_STRUCTURE_READ_BIT_KHR);
    });
    if (!ok) {
        spdlog::error("Acceleration structure build submission failed");
        return core::BuildError::DeviceFailure;
    }
    return core::BuildError::None;
}

VkDeviceAddress AccelerationStructureBuilder::structureAddress(VkAccelerationStructureKHR handle) const {
    VkAccelerationStructureDeviceAddressInfoKHR ai{};
    ai.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_DEVICE_ADDRESS_INFO_KHR;
    ai.accelerationStructure = handle;
    return vkGetAccelerationStructureDeviceAddressKHR(vk_->device(), &ai);
}

void AccelerationStructureBuilder::releaseStructure(VkAccelerationStructureKHR& handle, core::AllocatedBuffer& backing) {
    if (handle) {
        vkDestroyAccelerationStructureKHR(vk_->device(), handle, nullptr);
        handle = VK_NULL_HANDLE;
    }
    if (backing.valid() && !vk_->destroy(backing)) {
        spdlog::warn("AS backing buffer #{} release refused", backing.id);
    }
}

core::BuildError AccelerationStructureBuilder::buildBlas(const std::vector<GeometryDescriptor>& geometries, Blas& out) {
    core::BuildError verr = validateGeometries(geometries);
    if (verr != core::BuildError::None) return verr;
    if (!ready()) {
        spdlog::error("buildBlas: builder not initialized or ray tracing unsupported");
        return core::BuildError::Unsupported;
    }

    std::vector<VkAccelerationStructureGeometryKHR> geoms;
    std::vector<VkAccelerationStructureBuildRangeInfoKHR> ranges;
    std::vector<uint32_t> maxPrims;
    geoms.reserve(geometries.size());
    ranges.reserve(geometries.size());
    maxPrims.reserve(geometries.size());
    uint32_t totalPrims = 0;
    for (size_t i = 0; i < geometries.size(); ++i) {
        const GeometryDescriptor& g = geometries[i];
        if (g.vertices.address == 0 || g.indices.address == 0) {
            spdlog::error("BLAS geometry {}: buffers lack a device address (missing SHADER_DEVICE_ADDRESS usage)", i);
            return core::BuildError::Unsupported;
        }
        VkAccelerationStructureGeometryTrianglesDataKHR tri{};
        tri.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_TRIANGLES_DATA_KHR;
        tri.vertexFormat = g.vertexFormat;
        tri.vertexData.deviceAddress = g.vertices.address;
        tri.vertexStride = g.vertexStride;
        tri.maxVertex = g.vertexCount - 1;
        tri.indexType = g.indexType;
        tri.indexData.deviceAddress = g.indices.address;

        VkAccelerationStructureGeometryKHR geom{};
        geom.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_KHR;
        geom.geometryType = VK_GEOMETRY_TYPE_TRIANGLES_KHR;
        geom.flags = g.flags;
        geom.geometry.triangles = tri;
        geoms.push_back(geom);

        VkAccelerationStructureBuildRangeInfoKHR range{};
        range.primitiveCount = g.indexCount / 3;
        ranges.push_back(range);
        maxPrims.push_back(range.primitiveCount);
        totalPrims += range.primitiveCount;
    }

    VkAccelerationStructureBuildGeometryInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_GEOMETRY_INFO_KHR;
    info.type = VK_ACCELERATION_STRUCTURE_TYPE_BOTTOM_LEVEL_KHR;
    info.flags = buildFlags_;
    info.mode = VK_BUILD_ACCELERATION_STRUCTURE_MODE_BUILD_KHR;
    info.geometryCount = static_cast<uint32_t>(geoms.size());
    info.pGeometries = geoms.data();

    VkAccelerationStructureBuildSizesInfoKHR sizes{};
    sizes.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_SIZES_INFO_KHR;
    vkGetAccelerationStructureBuildSizesKHR(vk_->device(), VK_ACCELERATION_STRUCTURE_BUILD_TYPE_DEVICE_KHR,
                                            &info, maxPrims.data(), &sizes);
    if (sizes.accelerationStructureSize == 0) {
        spdlog::error("BLAS size query returned zero");
        return core::BuildError::DeviceFailure;
    }

    Blas blas;
    core::BuildError err = createStructure(VK_ACCELERATION_STRUCTURE_TYPE_BOTTOM_LEVEL_KHR,
                                           sizes.accelerationStructureSize, blas.backing, blas.handle);
    if (err != core::BuildError::None) return err;

    info.dstAccelerationStructure = blas.handle;
    err = submitBuild(info, ranges.data(), sizes.buildScratchSize);
    if (err == core::BuildError::None) {
        blas.address = structureAddress(blas.handle);
        if (blas.address == 0) {
            spdlog::error("BLAS device address query returned zero");
            err = core::BuildError::DeviceFailure;
        }
    }
    if (err != core::BuildError::None) {
        releaseStructure(blas.handle, blas.backing);
        return err;
    }

    blas.geometryCount = static_cast<uint32_t>(geoms.size());
    blas.primitiveCount = totalPrims;
    spdlog::info("BLAS built: {} geometries, {} triangles, {} bytes (scratch {})",
                 blas.geometryCount, totalPrims,
                 static_cast<uint64_t>(sizes.accelerationStructureSize),
                 static_cast<uint64_t>(sizes.buildScratchSize));
    out = std::move(blas);
    return core::BuildError::None;
}

core::BuildError AccelerationStructureBuilder::buildTlas(const std::vector<Instance>& instances,
                                                         BlasRegistry& registry,
                                                         Tlas& out) {
    core::BuildError verr = validateInstances(instances);
    if (verr != core::BuildError::None) return verr;

    std::vector<VkAccelerationStructureInstanceKHR> packed;
    packed.reserve(instances.size());
    for (size_t i = 0; i < instances.size(); ++i) {
        const Blas* blas = registry.find(instances[i].blas);
        if (!blas || blas->address == 0) {
            spdlog::error("TLAS instance {} references a BLAS that is no longer registered (slot {}, generation {})",
                          i, instances[i].blas.index, instances[i].blas.generation);
            return core::BuildError::StaleReference;
        }
        packed.push_back(packInstance(instances[i], blas->address));
    }
    if (!ready()) {
        spdlog::error("buildTlas: builder not initialized or ray tracing unsupported");
        return core::BuildError::Unsupported;
    }

    Tlas tlas;
    const VkDeviceSize instanceBytes = packed.size() * sizeof(VkAccelerationStructureInstanceKHR);
    core::AllocationError aerr = upload_->createDeviceBuffer(packed.data(), instanceBytes,
                                                             VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_BUILD_INPUT_READ_ONLY_BIT_KHR |
                                                                 VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT,
                                                             tlas.instances);
    if (aerr != core::AllocationError::None) {
        spdlog::error("TLAS instance buffer ({} bytes) failed: {}", static_cast<uint64_t>(instanceBytes), core::to_string(aerr));
        return core::BuildError::AllocationFailed;
    }

    VkAccelerationStructureGeometryInstancesDataKHR instData{};
    instData.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_INSTANCES_DATA_KHR;
    instData.arrayOfPointers = VK_FALSE;
    instData.data.deviceAddress = tlas.instances.address;

    VkAccelerationStructureGeometryKHR geom{};
    geom.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_KHR;
    geom.geometryType = VK_GEOMETRY_TYPE_INSTANCES_KHR;
    geom.geometry.instances = instData;

    VkAccelerationStructureBuildGeometryInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_GEOMETRY_INFO_KHR;
    info.type = VK_ACCELERATION_STRUCTURE_TYPE_TOP_LEVEL_KHR;
    info.flags = buildFlags_;
    info.mode = VK_BUILD_ACCELERATION_STRUCTURE_MODE_BUILD_KHR;
    info.geometryCount = 1;
    info.pGeometries = &geom;

    const uint32_t count = static_cast<uint32_t>(packed.size());
    VkAccelerationStructureBuildSizesInfoKHR sizes{};
    sizes.sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_SIZES_INFO_KHR;
    vkGetAccelerationStructureBuildSizesKHR(vk_->device(), VK_ACCELERATION_STRUCTURE_BUILD_TYPE_DEVICE_KHR,
                                            &info, &count, &sizes);

    core::BuildError err = core::BuildError::None;
    if (sizes.accelerationStructureSize == 0) {
        spdlog::error("TLAS size query returned zero");
        err = core::BuildError::DeviceFailure;
    }
    if (err == core::BuildError::None) {
        err = createStructure(VK_ACCELERATION_STRUCTURE_TYPE_TOP_LEVEL_KHR,
                              sizes.accelerationStructureSize, tlas.backing, tlas.handle);
    }
    if (err == core::BuildError::None) {
        info.dstAccelerationStructure = tlas.handle;
        VkAccelerationStructureBuildRangeInfoKHR range{};
        range.primitiveCount = count;
        err = submitBuild(info, &range, sizes.buildScratchSize);
    }
    if (err == core::BuildError::None) {
        tlas.address = structureAddress(tlas.handle);
        if (tlas.address == 0) {
            spdlog::error("TLAS device address query returned zero");
            err = core::BuildError::DeviceFailure;
        }
    }
    if (err != core::BuildError::None) {
        releaseStructure(tlas.handle, tlas.backing);
        if (!vk_->destroy(tlas.instances)) {
            spdlog::warn("TLAS instance buffer #{} release refused", tlas.instances.id);
        }
        return err;
    }

    tlas.instanceCount = count;
    tlas.referenced.reserve(instances.size());
    for (const Instance& inst : instances) {
        registry.addReference(inst.blas);
        tlas.referenced.push_back(inst.blas);
    }
    spdlog::info("TLAS built: {} instances, {} bytes", count, static_cast<uint64_t>(sizes.accelerationStructureSize));
    out = std::move(tlas);
    return core::BuildError::None;
}

bool AccelerationStructureBuilder::destroy(Blas& blas) {
    if (!blas.handle && !blas.backing.valid()) {
        blas = Blas{};
        return true;
    }
    if (!vk_) {
        spdlog::error("BLAS destroy without an initialized builder");
        return false;
    }
    if (!vk_->lifetimeTracker().checkRelease(blas.backing.id)) {
        return false;
    }
    releaseStructure(blas.handle, blas.backing);
    blas = Blas{};
    return true;
}

bool AccelerationStructureBuilder::destroy(Tlas& tlas, BlasRegistry& registry) {
    if (tlas.handle || tlas.backing.valid() || tlas.instances.valid()) {
        if (!vk_) {
            spdlog::error("TLAS destroy without an initialized builder");
            return false;
        }
        if (!vk_->lifetimeTracker().checkRelease(tlas.backing.id)) {
            return false;
        }
        releaseStructure(tlas.handle, tlas.backing);
        if (tlas.instances.valid() && !vk_->destroy(tlas.instances)) {
            spdlog::warn("TLAS instance buffer #{} release refused", tlas.instances.id);
        }
    }
    for (BlasHandle h : tlas.referenced) registry.releaseReference(h);
    tlas = Tlas{};
    return true;
}

} // namespace render
