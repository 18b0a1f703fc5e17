#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

namespace railseat::app {

using Deadline = std::chrono::steady_clock::time_point;

// Caller-owned flag to abort an in-flight book() from another thread.
class AbortFlag {
public:
    void request() noexcept { requested_.store(true); }
    bool isRequested() const noexcept { return requested_.load(); }

private:
    std::atomic<bool> requested_{false};
};

inline bool isRequested(const AbortFlag* abort) noexcept {
    return abort && abort->isRequested();
}

enum class WaitOutcome {
    Acquired,
    TimedOut,
    Aborted
};

// Locks `lock` (constructed with std::defer_lock) before `deadline`. With an
// abort flag the wait runs in short slices and gives up once it is raised.
inline WaitOutcome lockBefore(std::unique_lock<std::timed_mutex>& lock,
                              Deadline deadline,
                              const AbortFlag* abort) {
    constexpr auto kSlice = std::chrono::milliseconds(10);

    if (isRequested(abort)) {
        return WaitOutcome::Aborted;
    }
    if (!abort && deadline == Deadline::max()) {
        lock.lock();
        return WaitOutcome::Acquired;
    }

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return lock.try_lock() ? WaitOutcome::Acquired : WaitOutcome::TimedOut;
        }
        const auto sliceEnd = abort && deadline - now > kSlice ? now + kSlice : deadline;
        if (lock.try_lock_until(sliceEnd)) {
            return WaitOutcome::Acquired;
        }
        if (isRequested(abort)) {
            return WaitOutcome::Aborted;
        }
    }
}

} // namespace railseat::app
