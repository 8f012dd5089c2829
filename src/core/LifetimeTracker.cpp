#include "LifetimeTracker.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace core {

void LifetimeTracker::markInUse(ResourceId id, uint64_t serial) {
    if (id == kInvalidResource) return;
    uint64_t& last = lastUse_[id];
    last = std::max(last, serial);
}

void LifetimeTracker::markCompleted(uint64_t serial) {
    if (serial <= completed_) return;
    completed_ = serial;
    // Entries at or below the completed serial can no longer be in flight.
    for (auto it = lastUse_.begin(); it != lastUse_.end();) {
        if (it->second <= completed_) it = lastUse_.erase(it); else ++it;
    }
}

bool LifetimeTracker::isInFlight(ResourceId id) const {
    auto it = lastUse_.find(id);
    return it != lastUse_.end() && it->second > completed_;
}

bool LifetimeTracker::checkRelease(ResourceId id) {
    auto it = lastUse_.find(id);
    if (it == lastUse_.end() || it->second <= completed_) {
        if (it != lastUse_.end()) lastUse_.erase(it);
        return true;
    }
    if (!enabled_) {
        lastUse_.erase(it);
        return true;
    }
    ++violations_;
    spdlog::error("Resource #{} released while in flight (last used by submission {}, completed {})",
                  id, it->second, completed_);
    return false;
}

} // namespace core
