#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace webxfer {

using TimerId = std::uint64_t;

// Deferred-callback seam used for timeouts and rate-limit retries.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual TimerId schedule(const std::chrono::milliseconds &delay, std::function<void()> callback) = 0;
    virtual void cancel(const TimerId &id) = 0;
};

// Scheduler driven by the owner's event loop (or by hand in tests).
class TimerQueue : public Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(const Clock::time_point &now = Clock::now());

    TimerId schedule(const std::chrono::milliseconds &delay, std::function<void()> callback) override;
    void cancel(const TimerId &id) override;

    // Runs every callback due at or before `now`, in deadline order. Returns how many ran.
    size_t runDue(const Clock::time_point &now);
    // Advances the internal clock by `delta` and runs what became due.
    size_t advance(const std::chrono::milliseconds &delta);

    std::optional<Clock::time_point> nextDeadline() const;
    size_t pending() const;
    Clock::time_point now() const;

private:
    // ordered by (deadline, id) so equal deadlines fire in scheduling order
    std::map<std::pair<Clock::time_point, TimerId>, std::function<void()>> timers;
    std::map<TimerId, Clock::time_point> deadlines;
    TimerId next_id = 1;
    Clock::time_point current;
};

}
