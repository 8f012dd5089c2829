#include "FrameGraph.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace core {

namespace {

void labelColor(VkPipelineStageFlags2 stage, float out[4]) {
    out[3] = 1.0f;
    if (stage & VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT) {
        out[0] = 0.30f; out[1] = 0.55f; out[2] = 0.95f;
    } else if (stage & (VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT | VK_PIPELINE_STAGE_2_BLIT_BIT |
                        VK_PIPELINE_STAGE_2_COPY_BIT)) {
        out[0] = 0.95f; out[1] = 0.65f; out[2] = 0.20f;
    } else if (stage & VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT) {
        out[0] = 0.35f; out[1] = 0.85f; out[2] = 0.40f;
    } else {
        out[0] = out[1] = out[2] = 0.7f;
    }
}

} // namespace

void FrameGraph::beginFrame() {
    passes_.clear();
}

bool FrameGraph::addPass(std::string name, VkPipelineStageFlags2 stage, RecordFn record) {
    if (!record) {
        spdlog::error("FrameGraph: pass '{}' has no record function", name);
        return false;
    }
    auto same = [&](const Pass& p) { return p.name == name; };
    if (std::any_of(passes_.begin(), passes_.end(), same)) {
        spdlog::error("FrameGraph: pass '{}' added twice in one frame", name);
        return false;
    }
    passes_.push_back(Pass{std::move(name), stage, std::move(record)});
    return true;
}

size_t FrameGraph::execute(VkCommandBuffer commandBuffer) {
    const bool labels = vkCmdBeginDebugUtilsLabelEXT != nullptr && vkCmdEndDebugUtilsLabelEXT != nullptr;
    for (auto& pass : passes_) {
        if (labels) {
            VkDebugUtilsLabelEXT label{};
            label.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT;
            label.pLabelName = pass.name.c_str();
            labelColor(pass.stage, label.color);
            vkCmdBeginDebugUtilsLabelEXT(commandBuffer, &label);
        }
        pass.record(commandBuffer);
        if (labels) vkCmdEndDebugUtilsLabelEXT(commandBuffer);
    }
    return passes_.size();
}

void FrameGraph::endFrame() {
    std::string sequence;
    for (const auto& pass : passes_) {
        if (!sequence.empty()) sequence += " -> ";
        sequence += pass.name;
    }
    if (sequence != lastSequence_) {
        spdlog::debug("FrameGraph: {}", sequence.empty() ? "(no passes)" : sequence);
        lastSequence_ = std::move(sequence);
    }
    passes_.clear();
}

}
