#include "WorkQueue.h"

#include <exception>
#include "Log.h"

WorkQueue::WorkQueue(const char* name)
: _name(name), _worker(&WorkQueue::run, this)
{
}

WorkQueue::~WorkQueue() {
    shutdown();
}

bool WorkQueue::post(Job job) {
    if (!job) return false;

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running) {
        logf(LogLevel::Warn, "WorkQueue %s: post after shutdown ignored", _name);
        return false;
    }
    _jobs.push_back(std::move(job));
    _cv.notify_one();
    return true;
}

void WorkQueue::drain() {
    if (std::this_thread::get_id() == _worker.get_id()) {
        return;  // a job waiting for itself would never finish
    }
    std::unique_lock<std::mutex> lock(_mutex);
    _idleCv.wait(lock, [this] { return _jobs.empty() && !_busy; });
}

void WorkQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _running = false;
    }
    _cv.notify_all();

    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
        _worker.join();
    }
}

void WorkQueue::run() {
    std::unique_lock<std::mutex> lock(_mutex);

    for (;;) {
        _cv.wait(lock, [this] { return !_jobs.empty() || !_running; });
        if (_jobs.empty()) {
            break;  // shut down and nothing left to do
        }

        Job job = std::move(_jobs.front());
        _jobs.pop_front();
        _busy = true;

        lock.unlock();
        try {
            job();
        } catch (const std::exception& e) {
            logf(LogLevel::Error, "WorkQueue %s: job failed: %s", _name, e.what());
        } catch (...) {
            logf(LogLevel::Error, "WorkQueue %s: job failed: unknown exception", _name);
        }
        lock.lock();

        _busy = false;
        if (_jobs.empty()) {
            _idleCv.notify_all();
        }
    }
    _idleCv.notify_all();
}
