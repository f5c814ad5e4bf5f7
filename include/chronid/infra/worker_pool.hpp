/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool used to fan out bulk identifier generation.
 *
 * @details
 * The `chronid` tool and the concurrency tests hand batches of `next_id()`
 * calls to a `WorkerPool` so that a single generator is exercised by many
 * threads at once.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace chronid::infra {

/**
 * @class WorkerPool
 * @brief A thread-safe worker pool with a FIFO task queue.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `wait_idle()` blocks until the queue is empty and no task is running.
 *
 * A task that throws does not take down its worker. The first exception is
 * captured and rethrown from the next `wait_idle()`.
 */
class WorkerPool {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit WorkerPool(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains remaining tasks, then joins every worker.
     *
     * @note Blocking. Exceptions captured after the last `wait_idle()` are dropped.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Queues a task for asynchronous execution.
    void submit(std::function<void()> task);

    /**
     * @brief Blocks until every submitted task has finished.
     *
     * @throws Whatever the first failing task threw since the previous call.
     */
    void wait_idle();

    std::size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable work_ready_;
    std::condition_variable idle_;

    std::size_t active_ = 0;          ///< Tasks currently executing. Guarded by `queue_mutex_`.
    std::exception_ptr first_error_;  ///< Guarded by `queue_mutex_`.
    bool stop_ = false;               ///< Guarded by `queue_mutex_`.
};

} // namespace chronid::infra
