#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

// Shared cancel flag with an optional deadline. Copies observe the same
// state, so a caller can keep one copy and hand another to a long-running
// operation. Every deliberate pause in the engine goes through sleepFor().
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken withTimeout(std::chrono::milliseconds timeout) {
        CancellationToken t;
        t.state_->deadline = Clock::now() + timeout;
        return t;
    }

    void cancel() {
        {
            std::lock_guard lock(state_->mtx);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard lock(state_->mtx);
        return cancelledLocked();
    }

    std::optional<Clock::time_point> deadline() const {
        std::lock_guard lock(state_->mtx);
        return state_->deadline;
    }

    // Returns true if the full duration elapsed, false if woken by
    // cancellation or by the deadline passing.
    bool sleepFor(std::chrono::milliseconds duration) const {
        std::unique_lock lock(state_->mtx);
        auto until = Clock::now() + duration;
        bool cutShort = false;
        if (state_->deadline && *state_->deadline < until) {
            until = *state_->deadline;
            cutShort = true;
        }
        state_->cv.wait_until(lock, until, [&] { return state_->cancelled; });
        if (state_->cancelled) return false;
        return !cutShort;
    }

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        bool cancelled = false;
        std::optional<Clock::time_point> deadline;
    };

    bool cancelledLocked() const {
        if (state_->cancelled) return true;
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    std::shared_ptr<State> state_;
};
