//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the worker pool behind parallel unit scanning.  A single shared
// queue feeds all workers; completion order is irrelevant to callers because
// results are written to per-unit slots or a serialized collector and sorted
// afterwards.
//
//===----------------------------------------------------------------------===//

#include "support/worker_pool.hpp"

#include <utility>

namespace apicheck::support
{

WorkerPool::WorkerPool(size_t threads)
{
    if (threads == 0)
        threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 1;

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i)
        workers_.emplace_back([this] { workerLoop(); });
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    workAvailable_.notify_all();
    for (auto &worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
}

void WorkerPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
}

void WorkerPool::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
    if (firstError_)
    {
        std::exception_ptr error = std::exchange(firstError_, nullptr);
        lock.unlock();
        std::rethrow_exception(error);
    }
}

void WorkerPool::workerLoop()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        std::exception_ptr error;
        try
        {
            task();
        }
        catch (...)
        {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            if (error && !firstError_)
                firstError_ = error;
            if (queue_.empty() && running_ == 0)
                idle_.notify_all();
        }
    }
}

} // namespace apicheck::support
