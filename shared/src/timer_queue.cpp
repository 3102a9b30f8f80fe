#include "webxfer/timer_queue.hpp"

namespace webxfer {

TimerQueue::TimerQueue(const Clock::time_point &now) : current(now) {}

TimerId TimerQueue::schedule(const std::chrono::milliseconds &delay, std::function<void()> callback) {
    TimerId id = this->next_id++;
    Clock::time_point deadline = this->current + delay;
    this->timers.emplace(std::make_pair(deadline, id), std::move(callback));
    this->deadlines.emplace(id, deadline);
    return id;
}

void TimerQueue::cancel(const TimerId &id) {
    auto it = this->deadlines.find(id);
    if (it == this->deadlines.end()) {
        return;
    }
    this->timers.erase(std::make_pair(it->second, id));
    this->deadlines.erase(it);
}

size_t TimerQueue::runDue(const Clock::time_point &now) {
    if (now > this->current) {
        this->current = now;
    }
    size_t ran = 0;
    // callbacks may schedule or cancel timers, so re-inspect the head every time
    while (!this->timers.empty() && this->timers.begin()->first.first <= this->current) {
        auto it = this->timers.begin();
        TimerId id = it->first.second;
        std::function<void()> callback = std::move(it->second);
        this->timers.erase(it);
        this->deadlines.erase(id);
        callback();
        ran++;
    }
    return ran;
}

size_t TimerQueue::advance(const std::chrono::milliseconds &delta) {
    return this->runDue(this->current + delta);
}

std::optional<TimerQueue::Clock::time_point> TimerQueue::nextDeadline() const {
    if (this->timers.empty()) {
        return std::nullopt;
    }
    return this->timers.begin()->first.first;
}

size_t TimerQueue::pending() const {
    return this->timers.size();
}

TimerQueue::Clock::time_point TimerQueue::now() const {
    return this->current;
}

}
