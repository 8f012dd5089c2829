// Serial-based release checks.
#include <cstdarg>
#include <cstdio>

#include <spdlog/spdlog.h>

#include "core/LifetimeTracker.h"

using core::LifetimeTracker;

namespace {

void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "LifetimeTests failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
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
    spdlog::set_level(spdlog::level::off);
    bool success = true;

    // Untracked resources are always releasable
    {
        LifetimeTracker t;
        CHECK(!t.isInFlight(5), "unknown id is not in flight");
        CHECK(t.checkRelease(5), "unknown id may be released");
        t.markInUse(core::kInvalidResource, 3);
        CHECK(t.trackedCount() == 0, "invalid id is never tracked");
    }

    // Release is refused until the last using submission completes
    {
        LifetimeTracker t;
        t.markInUse(1, 4);
        t.markInUse(1, 2);   // older use does not lower the watermark
        CHECK(t.isInFlight(1), "in flight after use");
        t.markCompleted(3);
        CHECK(t.isInFlight(1), "still in flight: last use 4, completed 3");
        CHECK(!t.checkRelease(1), "release refused");
        CHECK(t.violationCount() == 1, "violation counted (%llu)", static_cast<unsigned long long>(t.violationCount()));
        t.markCompleted(4);
        CHECK(!t.isInFlight(1), "retired once completed reaches the last use");
        CHECK(t.checkRelease(1), "release allowed");
        CHECK(t.trackedCount() == 0, "completed entries are dropped (%zu)", t.trackedCount());
    }

    // Completion never moves backwards
    {
        LifetimeTracker t;
        t.markCompleted(10);
        t.markCompleted(7);
        CHECK(t.completedSerial() == 10, "completed stays at 10 (%llu)", static_cast<unsigned long long>(t.completedSerial()));
        t.markInUse(2, 9);
        CHECK(!t.isInFlight(2), "use at an already completed serial is not in flight");
    }

    // Disabled checks allow the release and do not count it
    {
        LifetimeTracker t;
        t.setEnabled(false);
        t.markInUse(3, 1);
        CHECK(t.checkRelease(3), "disabled tracker never refuses");
        CHECK(t.violationCount() == 0, "nothing counted while disabled");
        CHECK(!t.isInFlight(3), "released entry forgotten");
    }

    return success ? 0 : 1;
}
