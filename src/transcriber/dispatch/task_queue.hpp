#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Fixed pool of workers over a bounded FIFO of jobs.
// try_post() refuses work instead of growing past `capacity` pending jobs.
class TaskQueue {
public:
    using Job = std::function<void()>;

    TaskQueue(unsigned workers, size_t capacity);
    // Stops intake, runs every job already queued, then joins the workers.
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    bool try_post(Job job);

    size_t pending() const;
    size_t capacity() const { return capacity_; }
    unsigned workers() const { return static_cast<unsigned>(workers_.size()); }

private:
    void run(std::stop_token st);

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    bool closed_ = false;
    std::vector<std::jthread> workers_;
};
