#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace polygate {

// Runs fn on a detached thread. wait_until() gives up at the deadline and the
// late result, if any, is dropped with the shared state. fn must own
// (or share ownership of) everything it touches.
template <typename T>
class BoundedTask {
public:
    enum class Status { done, failed, timed_out };

    explicit BoundedTask(std::function<T()> fn) : state_(std::make_shared<State>()) {
        auto state = state_;
        std::thread([state, fn = std::move(fn)]() {
            std::optional<T> value;
            std::string error;
            try {
                value = fn();
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "unknown exception";
            }
            std::lock_guard<std::mutex> lock(state->mu);
            state->value = std::move(value);
            state->error = std::move(error);
            state->finished = true;
            state->cv.notify_all();
        }).detach();
    }

    Status wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(state_->mu);
        if (!state_->cv.wait_until(lock, deadline, [this] { return state_->finished; })) {
            return Status::timed_out;
        }
        return state_->value ? Status::done : Status::failed;
    }

    // Valid after wait_until returned done
    T take() {
        std::lock_guard<std::mutex> lock(state_->mu);
        return std::move(*state_->value);
    }

    std::string error() const {
        std::lock_guard<std::mutex> lock(state_->mu);
        return state_->error;
    }

private:
    struct State {
        std::mutex mu;
        std::condition_variable cv;
        bool finished = false;
        std::optional<T> value;
        std::string error;
    };
    std::shared_ptr<State> state_;
};

} // namespace polygate
