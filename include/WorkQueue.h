#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// FIFO of jobs drained by one dedicated worker thread.
// Used to move notifications off threads that must never block
// (e.g. the decoder task raising end-of-stream).
class WorkQueue {
public:
    using Job = std::function<void()>;

    explicit WorkQueue(const char* name = "work");
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Returns false once the queue has been shut down.
    bool post(Job job);

    // Block until every job posted so far has finished.
    void drain();

    // Finish queued jobs, then join the worker. Idempotent.
    void shutdown();

private:
    void run();

    const char*             _name;
    std::mutex              _mutex;
    std::condition_variable _cv;
    std::condition_variable _idleCv;
    std::deque<Job>         _jobs;
    bool                    _busy    = false;
    bool                    _running = true;
    std::thread             _worker;
};
