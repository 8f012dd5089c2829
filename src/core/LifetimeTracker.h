#pragma once

#include <cstdint>
#include <unordered_map>

#include "core/GpuAllocator.h"

namespace core {

// Debug-mode detector for resources released while GPU work still references them.
//
// Every submission gets a serial. Recording code marks the resources it binds
// with the serial of the frame being recorded; the frame controller advances
// the completed serial each time it observes a fence signaled. A release is a
// violation while lastUse > completed.
class LifetimeTracker {
public:
    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    void markInUse(ResourceId id, uint64_t serial);
    void markCompleted(uint64_t serial);

    bool isInFlight(ResourceId id) const;

    // True when `id` may be released now. A violation is logged and counted
    // (and false returned) only while checks are enabled.
    bool checkRelease(ResourceId id);

    uint64_t completedSerial() const { return completed_; }
    uint64_t violationCount() const { return violations_; }
    size_t trackedCount() const { return lastUse_.size(); }

private:
    std::unordered_map<ResourceId, uint64_t> lastUse_;
    uint64_t completed_ = 0;
    uint64_t violations_ = 0;
    bool enabled_ = true;
};

} // namespace core
