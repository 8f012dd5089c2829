#pragma once

#include <utility>

#include <spdlog/spdlog.h>

namespace core {

// Scoped: release-on-exit wrapper for an AllocatedBuffer/AllocatedImage.
//
// `Owner` is whatever hands out the resource and exposes `bool destroy(Resource&)`
// (the device context). Used for transient resources such as AS scratch and
// staging buffers; call release() to keep the resource past the scope.
template <typename Resource, typename Owner>
class Scoped {
public:
    explicit Scoped(Owner& owner) : owner_(&owner) {}
    Scoped(Owner& owner, Resource&& res) : owner_(&owner), res_(std::move(res)) {}
    ~Scoped() { reset(); }

    Scoped(const Scoped&) = delete;
    Scoped& operator=(const Scoped&) = delete;
    Scoped(Scoped&& o) noexcept : owner_(o.owner_), res_(std::move(o.res_)) {}

    Resource& get() { return res_; }
    const Resource& get() const { return res_; }
    Resource* operator->() { return &res_; }
    const Resource* operator->() const { return &res_; }

    Resource release() { return std::move(res_); }

    void reset() {
        if (owner_ && res_.valid() && !owner_->destroy(res_)) {
            spdlog::warn("Scoped release of resource #{} refused; kept alive until shutdown", res_.id);
        }
    }

private:
    Owner* owner_ = nullptr;
    Resource res_{};
};

} // namespace core
