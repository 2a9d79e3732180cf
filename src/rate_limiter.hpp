#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace polygate {

// Sliding one-minute window per client key (remote address or API key).
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int requests_per_minute)
        : rpm_(requests_per_minute) {}

    // Records the request and returns true when the key is under its limit
    bool allow(const std::string& key, Clock::time_point now = Clock::now()) {
        if (rpm_ <= 0) return true;  // 0 = unlimited

        std::lock_guard<std::mutex> lock(mutex_);
        auto& window = windows_[key];
        prune(window, now);
        if (static_cast<int>(window.size()) >= rpm_) return false;
        window.push_back(now);

        // Idle keys would otherwise accumulate forever
        if (windows_.size() > kMaxKeys) {
            for (auto it = windows_.begin(); it != windows_.end();) {
                prune(it->second, now);
                it = it->second.empty() ? windows_.erase(it) : std::next(it);
            }
        }
        return true;
    }

    // Seconds until the oldest request in the key's window expires
    int retry_after(const std::string& key, Clock::time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = windows_.find(key);
        if (it == windows_.end() || it->second.empty()) return 0;
        auto left = std::chrono::duration_cast<std::chrono::seconds>(
            it->second.front() + std::chrono::seconds(60) - now).count();
        return left > 0 ? static_cast<int>(left) + 1 : 0;
    }

private:
    static constexpr size_t kMaxKeys = 4096;

    static void prune(std::deque<Clock::time_point>& window, Clock::time_point now) {
        auto cutoff = now - std::chrono::seconds(60);
        while (!window.empty() && window.front() < cutoff) window.pop_front();
    }

    int rpm_;
    std::mutex mutex_;
    std::map<std::string, std::deque<Clock::time_point>> windows_;
};

} // namespace polygate
