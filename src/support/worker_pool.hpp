//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/worker_pool.hpp
// Purpose: Fixed-size worker pool running one task per scanned unit.
// Key invariants: At most size() tasks run concurrently; wait() returns only
//                 after every submitted task finished; the first exception a
//                 task throws is rethrown from wait().
// Ownership/Lifetime: The pool owns its threads and joins them on destruction.
// Links: check/ApiChecker.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace apicheck::support
{

class WorkerPool
{
  public:
    using Task = std::function<void()>;

    /// @brief Start @p threads workers; 0 selects the hardware concurrency.
    explicit WorkerPool(size_t threads);

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /// @brief Stop accepting work, drain the queue, and join all workers.
    ~WorkerPool();

    /// @brief Queue @p task for execution on some worker.
    void submit(Task task);

    /// @brief Block until the queue is empty and no task is running.
    /// @throws The first exception escaping a task since the last wait().
    void wait();

    [[nodiscard]] size_t size() const
    {
        return workers_.size();
    }

  private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    size_t running_ = 0;
    bool stopping_ = false;
    std::exception_ptr firstError_;
};

} // namespace apicheck::support
