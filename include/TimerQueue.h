#pragma once

#include <stdint.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// One-shot timers executed on a single background worker.
//
// Callbacks run one at a time, in deadline order, without any TimerQueue lock
// held, so a callback may schedule or cancel timers (including its own
// successor). Cancellation is best-effort: a callback that has already been
// dequeued still runs to completion.
class TimerQueue {
public:
    using TimerId  = uint32_t;
    using Callback = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Run cb once after delayMs. Returns INVALID_TIMER after shutdown().
    TimerId scheduleAfter(uint32_t delayMs, Callback cb);

    // Returns true if the timer was still pending and will not run.
    bool cancel(TimerId id);

    // Number of timers waiting to fire.
    size_t pending() const;

    // Drop all pending timers and join the worker. Idempotent.
    void shutdown();

    // Monotonic milliseconds since an arbitrary epoch (millis() equivalent).
    static uint32_t nowMs();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point deadline;
        Callback          cb;
    };

    void run();

    mutable std::mutex      _mutex;
    std::condition_variable _cv;
    std::map<TimerId, Entry> _timers;
    // Deadline index; ties fire in scheduling order.
    std::multimap<Clock::time_point, TimerId> _byDeadline;
    TimerId     _nextId  = 1;
    bool        _running = true;
    std::thread _worker;
};
