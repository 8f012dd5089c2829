#include "RenderTargets.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/Upload.h"
#include "platform/VulkanContext.h"
#include "render/VulkanUtils.h"

namespace render {

bool RenderTargets::init(platform::VulkanContext& vk, core::UploadContext& upload, uint32_t slots, VkExtent2D extent) {
    vk_ = &vk;
    upload_ = &upload;
    count_ = std::min<uint32_t>(slots, core::kMaxFramesInFlight);
    if (!createImages(extent)) {
        shutdown();
        return false;
    }
    return true;
}

bool RenderTargets::resize(VkExtent2D extent) {
    if (extent.width == extent_.width && extent.height == extent_.height) {
        return true;
    }
    if (!destroyImages()) {
        return false;
    }
    return createImages(extent);
}

void RenderTargets::shutdown() {
    if (!vk_) return;
    if (!destroyImages()) {
        spdlog::warn("RenderTargets: some targets were still in flight at shutdown");
    }
    extent_ = {};
    count_ = 0;
    vk_ = nullptr;
    upload_ = nullptr;
}

bool RenderTargets::createImages(VkExtent2D extent) {
    const VkImageUsageFlags usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    for (uint32_t i = 0; i < count_; ++i) {
        core::AllocationError err = vk_->createImage(extent, kFormat, usage, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, images_[i]);
        if (err != core::AllocationError::None) {
            spdlog::error("RenderTargets: slot {} image {}x{} failed: {}", i, extent.width, extent.height, core::to_string(err));
            return false;
        }
    }
    const bool ok = upload_->submitImmediate([&](VkCommandBuffer cmd) {
        for (uint32_t i = 0; i < count_; ++i) {
            vkutil::imageBarrier(cmd, images_[i].image,
                                 VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_GENERAL,
                                 VK_PIPELINE_STAGE_2_NONE, VK_ACCESS_2_NONE,
                                 VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                                 VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT | VK_ACCESS_2_SHADER_STORAGE_READ_BIT);
        }
    });
    if (!ok) {
        spdlog::error("RenderTargets: initial layout transition failed");
        return false;
    }
    extent_ = extent;
    spdlog::debug("RenderTargets: {} x {}x{} storage images", count_, extent.width, extent.height);
    return true;
}

bool RenderTargets::destroyImages() {
    bool ok = true;
    for (uint32_t i = 0; i < count_; ++i) {
        if (images_[i].valid() && !vk_->destroy(images_[i])) ok = false;
    }
    return ok;
}

void RenderTargets::recordCopyToSwapchain(VkCommandBuffer cmd,
                                          uint32_t slot,
                                          VkImage swapchainImage,
                                          VkExtent2D swapchainExtent) const {
    const core::AllocatedImage& src = images_[slot];
    vkutil::imageBarrier(cmd, src.image,
                         VK_IMAGE_LAYOUT_GENERAL, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                         VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_READ_BIT);
    // Contents of a freshly acquired image are discarded.
    vkutil::imageBarrier(cmd, swapchainImage,
                         VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_NONE,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT);

    // Blit rather than copy: the swapchain may be BGRA while targets are RGBA.
    VkImageBlit2 region{};
    region.sType = VK_STRUCTURE_TYPE_IMAGE_BLIT_2;
    region.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
    region.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
    region.srcOffsets[1] = {static_cast<int32_t>(extent_.width), static_cast<int32_t>(extent_.height), 1};
    region.dstOffsets[1] = {static_cast<int32_t>(swapchainExtent.width), static_cast<int32_t>(swapchainExtent.height), 1};
    VkBlitImageInfo2 blit{};
    blit.sType = VK_STRUCTURE_TYPE_BLIT_IMAGE_INFO_2;
    blit.srcImage = src.image;
    blit.srcImageLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    blit.dstImage = swapchainImage;
    blit.dstImageLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
    blit.regionCount = 1;
    blit.pRegions = &region;
    blit.filter = VK_FILTER_NEAREST;
    vkCmdBlitImage2(cmd, &blit);

    vkutil::imageBarrier(cmd, src.image,
                         VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, VK_IMAGE_LAYOUT_GENERAL,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_READ_BIT,
                         VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                         VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT | VK_ACCESS_2_SHADER_STORAGE_READ_BIT);
    vkutil::imageBarrier(cmd, swapchainImage,
                         VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                         VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                         VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT);
}

void RenderTargets::recordPresentTransition(VkCommandBuffer cmd, VkImage swapchainImage) {
    vkutil::imageBarrier(cmd, swapchainImage,
                         VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                         VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
                         VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT, VK_ACCESS_2_NONE);
}

} // namespace render
