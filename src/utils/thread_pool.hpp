// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef thread_pool_hpp
#define thread_pool_hpp

#include <cstddef>
#include <vector>
#include <deque>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <utility>
#include <stdexcept>

namespace heredity {

/**
 A fixed set of worker threads that run submitted jobs in submission order. The destructor
 finishes every job already submitted before joining the workers.
 */
class ThreadPool
{
public:
    ThreadPool() = delete;
    explicit ThreadPool(std::size_t num_workers);
    
    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&)                 = delete;
    ThreadPool& operator=(ThreadPool&&)      = delete;
    
    ~ThreadPool();
    
    std::size_t size() const noexcept;
    
    // Exceptions thrown by job are rethrown by the returned future
    template <typename Job>
    auto submit(Job job) -> std::future<decltype(job())>;
    
private:
    using Task = std::packaged_task<void()>;
    
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_changed_;
    bool closed_;
    
    void run_worker();
};

template <typename Job>
auto ThreadPool::submit(Job job) -> std::future<decltype(job())>
{
    using Result = decltype(job());
    auto packaged_job = std::make_shared<std::packaged_task<Result()>>(std::move(job));
    auto result = packaged_job->get_future();
    {
        std::lock_guard<std::mutex> lock {queue_mutex_};
        if (closed_) throw std::logic_error {"ThreadPool::submit called on a closed pool"};
        queue_.emplace_back([packaged_job] () { (*packaged_job)(); });
    }
    queue_changed_.notify_one();
    return result;
}

} // namespace heredity

#endif
