#include "IdleResetTimer.h"

#include "Log.h"

IdleResetTimer::IdleResetTimer(TimerQueue& timers, uint32_t timeoutMs,
                               Predicate awayFromDefault, Action resetToDefault)
: _timers(timers),
  _awayFromDefault(std::move(awayFromDefault)),
  _resetToDefault(std::move(resetToDefault)),
  _timeoutMs(timeoutMs)
{
}

IdleResetTimer::~IdleResetTimer() {
    std::lock_guard<std::mutex> lock(_mutex);
    cancelLocked();
}

void IdleResetTimer::cancelLocked() {
    if (_timer != TimerQueue::INVALID_TIMER) {
        _timers.cancel(_timer);
        _timer = TimerQueue::INVALID_TIMER;
    }
}

void IdleResetTimer::cancel() {
    std::lock_guard<std::mutex> lock(_mutex);
    cancelLocked();
}

void IdleResetTimer::rescheduleIfNeeded() {
    std::lock_guard<std::mutex> lock(_mutex);
    cancelLocked();

    if (!_awayFromDefault || !_awayFromDefault()) {
        return;
    }

    // fire() needs this lock, so it cannot observe _timer before it is set.
    const uint32_t generation = ++_generation;
    _timer = _timers.scheduleAfter(_timeoutMs, [this, generation]() {
        fire(generation);
    });
}

bool IdleResetTimer::isScheduled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timer != TimerQueue::INVALID_TIMER;
}

void IdleResetTimer::setTimeout(uint32_t ms) {
    std::lock_guard<std::mutex> lock(_mutex);
    _timeoutMs = ms;
}

uint32_t IdleResetTimer::timeout() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timeoutMs;
}

void IdleResetTimer::fire(uint32_t generation) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (generation != _generation || _timer == TimerQueue::INVALID_TIMER) {
        return;  // cancelled or superseded after it was dequeued
    }
    _timer = TimerQueue::INVALID_TIMER;

    if (_awayFromDefault && _awayFromDefault()) {
        logf(LogLevel::Info, "Carousel reset to default position due to inactivity");
        if (_resetToDefault) {
            _resetToDefault();
        }
    }
}
