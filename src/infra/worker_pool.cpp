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
 * @file worker_pool.cpp
 * @brief Implementation of the worker pool and its idle barrier.
 */

#include "chronid/infra/worker_pool.hpp"

#include <exception>
#include <utility>

namespace chronid::infra {

WorkerPool::WorkerPool(std::size_t threads)
{
    if (threads == 0) {
        threads = 1;
    }

    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    work_ready_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    work_ready_.notify_one();
}

void WorkerPool::wait_idle()
{
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
        error = std::exchange(first_error_, nullptr);
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

/**
 * @brief Event loop of one worker.
 *
 * Exits only once `stop_` is set and the queue is drained, so tasks
 * submitted before destruction always run.
 */
void WorkerPool::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_ready_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        // Run outside the lock so other workers can pick up tasks.
        std::exception_ptr error;
        try {
            if (task) {
                task();
            }
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
            if (error && !first_error_) {
                first_error_ = error;
            }
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace chronid::infra
