#pragma once

// FrameGraph: the passes recorded into one frame's command buffer.
//
// Passes run in the order they were added. Each names the pipeline stage it
// mostly occupies; the stage picks the debug label colour so captures group
// compute, transfer and attachment work at a glance. Barriers stay the
// responsibility of the pass that changes a layout.

#include <functional>
#include <string>
#include <vector>

#include <volk.h>

namespace core {

class FrameGraph {
public:
    using RecordFn = std::function<void(VkCommandBuffer)>;

    struct Pass {
        std::string name;
        VkPipelineStageFlags2 stage = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        RecordFn record;
    };

    void beginFrame();
    // Rejects (false) an empty record or a name already used this frame.
    bool addPass(std::string name, VkPipelineStageFlags2 stage, RecordFn record);
    // Records every pass; returns how many were recorded.
    size_t execute(VkCommandBuffer commandBuffer);
    void endFrame();

    const std::vector<Pass>& passes() const { return passes_; }

private:
    std::vector<Pass> passes_;
    std::string lastSequence_;
};

}
