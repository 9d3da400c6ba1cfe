#include "task_queue.hpp"

#include <algorithm>
#include <exception>
#include <print>

TaskQueue::TaskQueue(unsigned workers, size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {
    workers = std::max(workers, 1u);
    workers_.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token st) { run(st); });
    }
}

TaskQueue::~TaskQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    for (auto& w : workers_) w.request_stop();
    cv_.notify_all();
    workers_.clear(); // joins
}

bool TaskQueue::try_post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || jobs_.size() >= capacity_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void TaskQueue::run(std::stop_token st) {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, st, [this] { return !jobs_.empty(); });
            // Drain what was accepted before shutting down
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            std::println(stderr, "queue: job failed: {}", e.what());
        } catch (...) {
            std::println(stderr, "queue: job failed with a non-standard exception");
        }
    }
}
