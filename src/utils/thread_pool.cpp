// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "thread_pool.hpp"

namespace heredity {

ThreadPool::ThreadPool(const std::size_t num_workers)
: workers_ {}
, queue_ {}
, closed_ {false}
{
    workers_.reserve(num_workers);
    for (std::size_t i {0}; i < num_workers; ++i) {
        workers_.emplace_back(&ThreadPool::run_worker, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> lock {queue_mutex_};
        closed_ = true;
    }
    queue_changed_.notify_all();
    for (auto& worker : workers_) worker.join();
}

std::size_t ThreadPool::size() const noexcept
{
    return workers_.size();
}

void ThreadPool::run_worker()
{
    for (;;) {
        Task task {};
        {
            std::unique_lock<std::mutex> lock {queue_mutex_};
            queue_changed_.wait(lock, [this] () { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return; // closed and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace heredity
