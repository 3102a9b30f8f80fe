#pragma once

#include <chrono>
#include <cstdint>

namespace webxfer {

// Windowed byte budget for a single transfer. A budget of 0 bytes/s means unlimited.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Decision {
        bool allowed;
        std::uint64_t wait_ms;
        std::uint64_t current_rate;
    };

    explicit RateLimiter(const std::uint64_t &bytes_per_second,
                         const std::chrono::milliseconds &window = std::chrono::milliseconds(1000),
                         const Clock::time_point &now = Clock::now());

    // Admits `bytes` into the current window, or tells the caller how long to wait.
    // A denied request leaves the window untouched.
    Decision checkAndUpdate(const std::uint64_t &bytes, const Clock::time_point &now = Clock::now());
    bool wouldAllow(const std::uint64_t &bytes, const Clock::time_point &now = Clock::now()) const;

    void pause();
    void resume(const Clock::time_point &now = Clock::now());
    bool isPaused() const;
    void reset(const Clock::time_point &now = Clock::now());

    std::uint64_t calculateCurrentRate(const Clock::time_point &now = Clock::now()) const;
    std::uint64_t getTotalBytes() const;
    std::uint64_t getElapsedMs(const Clock::time_point &now = Clock::now()) const;
    std::uint64_t getBytesPerSecond() const;
    bool isUnlimited() const;

private:
    const std::uint64_t bytes_per_second;
    const std::chrono::milliseconds window;

    std::uint64_t bytes_in_window = 0;
    Clock::time_point window_start;
    std::uint64_t total_bytes = 0;
    Clock::time_point start_time;
    bool paused = false;

    std::uint64_t windowElapsedMs(const Clock::time_point &now) const;
    bool fits(const std::uint64_t &in_window, const std::uint64_t &bytes) const;
};

}
