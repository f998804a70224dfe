#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sm::sync {

// Cooperative control of a running migration. The driver calls wait() between units
// of work; while paused it blocks on the condition variable until told otherwise.
class PauseToken {
public:
    enum class State { Run, Pause, Stop, Cancel };

    void pause() { set(State::Pause); }
    void resume() { set(State::Run); }

    // Suspend: persist and leave the driver, resumable from the persisted session.
    void stop() { set(State::Stop); }
    void cancel() { set(State::Cancel); }

    [[nodiscard]] State state() const {
        std::scoped_lock lock(mutex_);
        return state_;
    }

    // Returns Run, Stop or Cancel; never returns while paused.
    State wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return state_ != State::Pause; });
        return state_;
    }

    // As wait(), but gives up after timeout and then returns Pause.
    template <typename Rep, typename Period>
    State waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return state_ != State::Pause; });
        return state_;
    }

private:
    void set(const State s) {
        {
            std::scoped_lock lock(mutex_);
            // A cancel is final.
            if (state_ == State::Cancel) return;
            state_ = s;
        }
        cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Run;
};

}
