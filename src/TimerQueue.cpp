#include "TimerQueue.h"

#include <exception>
#include "Log.h"

TimerQueue::TimerQueue()
: _worker(&TimerQueue::run, this)
{
}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::scheduleAfter(uint32_t delayMs, Callback cb) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running || !cb) {
        return INVALID_TIMER;
    }

    TimerId id = _nextId++;
    if (_nextId == INVALID_TIMER) {
        _nextId = 1;  // wrapped
    }

    Entry e;
    e.deadline = Clock::now() + std::chrono::milliseconds(delayMs);
    e.cb       = std::move(cb);

    _byDeadline.insert(std::make_pair(e.deadline, id));
    _timers[id] = std::move(e);
    _cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    if (id == INVALID_TIMER) return false;

    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _timers.find(id);
    if (it == _timers.end()) {
        return false;
    }

    auto range = _byDeadline.equal_range(it->second.deadline);
    for (auto d = range.first; d != range.second; ++d) {
        if (d->second == id) {
            _byDeadline.erase(d);
            break;
        }
    }
    _timers.erase(it);
    _cv.notify_one();
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timers.size();
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_running && !_worker.joinable()) {
            return;
        }
        _running = false;
        _timers.clear();
        _byDeadline.clear();
    }
    _cv.notify_all();

    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
        _worker.join();
    }
}

uint32_t TimerQueue::nowMs() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(_mutex);

    while (_running) {
        if (_byDeadline.empty()) {
            _cv.wait(lock);
            continue;
        }

        auto next = _byDeadline.begin();
        if (Clock::now() < next->first) {
            _cv.wait_until(lock, next->first);
            continue;  // re-evaluate: cancelled, rescheduled or shut down
        }

        TimerId id = next->second;
        _byDeadline.erase(next);

        auto it = _timers.find(id);
        if (it == _timers.end()) {
            continue;
        }
        Callback cb = std::move(it->second.cb);
        _timers.erase(it);

        lock.unlock();
        try {
            cb();
        } catch (const std::exception& e) {
            logf(LogLevel::Error, "Timer %u callback failed: %s", id, e.what());
        } catch (...) {
            logf(LogLevel::Error, "Timer %u callback failed: unknown exception", id);
        }
        lock.lock();
    }
}
