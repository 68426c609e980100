#pragma once

#include <stdint.h>
#include <functional>
#include <mutex>

#include "TimerQueue.h"

// Returns the carousel to its default position after a period without
// carousel-affecting activity.
//
// cancel(), rescheduleIfNeeded() and the fire callback all run under one
// lock, so at most one reset is ever pending and a reset that lost the race
// against a reschedule does nothing.
class IdleResetTimer {
public:
    using Predicate = std::function<bool()>;
    using Action    = std::function<void()>;

    // awayFromDefault and resetToDefault run with the timer lock held and
    // must not call back into this object.
    IdleResetTimer(TimerQueue& timers, uint32_t timeoutMs,
                   Predicate awayFromDefault, Action resetToDefault);
    ~IdleResetTimer();

    IdleResetTimer(const IdleResetTimer&) = delete;
    IdleResetTimer& operator=(const IdleResetTimer&) = delete;

    void cancel();
    // Cancel any pending reset and, when away from default, start a fresh one.
    void rescheduleIfNeeded();

    bool isScheduled() const;

    // Applies from the next reschedule.
    void setTimeout(uint32_t ms);
    uint32_t timeout() const;

private:
    void cancelLocked();
    void fire(uint32_t generation);

    TimerQueue&         _timers;
    Predicate           _awayFromDefault;
    Action              _resetToDefault;
    mutable std::mutex  _mutex;
    uint32_t            _timeoutMs;
    TimerQueue::TimerId _timer      = TimerQueue::INVALID_TIMER;
    uint32_t            _generation = 0;   // identifies the live scheduling
};

// Brackets one mutating operation: cancels on entry, reschedules on every
// exit path. Declare it before any lock the operation takes so the lock is
// released before the reschedule runs.
class IdleScope {
public:
    explicit IdleScope(IdleResetTimer& timer) : _timer(timer) { _timer.cancel(); }
    ~IdleScope() { _timer.rescheduleIfNeeded(); }

    IdleScope(const IdleScope&) = delete;
    IdleScope& operator=(const IdleScope&) = delete;

private:
    IdleResetTimer& _timer;
};
