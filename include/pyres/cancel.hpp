#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace pyres {

// Shared stop signal for one resolve call: an explicit cancel flag plus an
// optional wall-clock deadline. Checked by the engine, the prefetch workers,
// the HTTP transport and subprocess waits.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() { cancelled_.store(true); }

    void set_deadline(Clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(mu_);
        deadline_ = deadline;
    }

    void clear_deadline() {
        std::lock_guard<std::mutex> lock(mu_);
        deadline_.reset();
    }

    // Clears both the flag and the deadline for the next run
    void reset() {
        cancelled_.store(false);
        clear_deadline();
    }

    bool deadline_passed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return deadline_ && Clock::now() >= *deadline_;
    }

    bool is_cancelled() const {
        return cancelled_.load() || deadline_passed();
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mu_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace pyres
