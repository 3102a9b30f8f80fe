#include "webxfer/rate_limiter.hpp"

#include <algorithm>

namespace webxfer {

RateLimiter::RateLimiter(const std::uint64_t &bytes_per_second, const std::chrono::milliseconds &window, const Clock::time_point &now)
    : bytes_per_second(bytes_per_second), window(window), window_start(now), start_time(now) {}

RateLimiter::Decision RateLimiter::checkAndUpdate(const std::uint64_t &bytes, const Clock::time_point &now) {
    const std::uint64_t window_ms = static_cast<std::uint64_t>(this->window.count());

    if (this->paused) {
        return Decision{false, std::max<std::uint64_t>(1, window_ms), this->calculateCurrentRate(now)};
    }

    if (this->isUnlimited()) {
        this->total_bytes += bytes;
        return Decision{true, 0, this->calculateCurrentRate(now)};
    }

    std::uint64_t elapsed = this->windowElapsedMs(now);
    if (elapsed >= window_ms) {
        this->bytes_in_window = 0;
        this->window_start = now;
        elapsed = 0;
    }

    if (this->fits(this->bytes_in_window, bytes)) {
        this->bytes_in_window += bytes;
        this->total_bytes += bytes;
        return Decision{true, 0, this->calculateCurrentRate(now)};
    }

    std::uint64_t wait = window_ms > elapsed ? window_ms - elapsed : 0;
    return Decision{false, std::max<std::uint64_t>(1, wait), this->calculateCurrentRate(now)};
}

bool RateLimiter::wouldAllow(const std::uint64_t &bytes, const Clock::time_point &now) const {
    if (this->paused) {
        return false;
    }
    if (this->isUnlimited()) {
        return true;
    }
    if (this->windowElapsedMs(now) >= static_cast<std::uint64_t>(this->window.count())) {
        return this->fits(0, bytes);
    }
    return this->fits(this->bytes_in_window, bytes);
}

void RateLimiter::pause() {
    this->paused = true;
}

void RateLimiter::resume(const Clock::time_point &now) {
    this->paused = false;
    this->window_start = now;
    this->bytes_in_window = 0;
}

bool RateLimiter::isPaused() const {
    return this->paused;
}

void RateLimiter::reset(const Clock::time_point &now) {
    this->bytes_in_window = 0;
    this->window_start = now;
    this->total_bytes = 0;
    this->start_time = now;
    this->paused = false;
}

std::uint64_t RateLimiter::calculateCurrentRate(const Clock::time_point &now) const {
    std::uint64_t elapsed = this->getElapsedMs(now);
    if (elapsed == 0) {
        return 0;
    }
    return this->total_bytes * 1000 / elapsed;
}

std::uint64_t RateLimiter::getTotalBytes() const {
    return this->total_bytes;
}

std::uint64_t RateLimiter::getElapsedMs(const Clock::time_point &now) const {
    if (now <= this->start_time) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now - this->start_time).count());
}

std::uint64_t RateLimiter::getBytesPerSecond() const {
    return this->bytes_per_second;
}

bool RateLimiter::isUnlimited() const {
    return this->bytes_per_second == 0;
}

std::uint64_t RateLimiter::windowElapsedMs(const Clock::time_point &now) const {
    if (now <= this->window_start) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now - this->window_start).count());
}

bool RateLimiter::fits(const std::uint64_t &in_window, const std::uint64_t &bytes) const {
    return in_window + bytes <= this->bytes_per_second;
}

}
