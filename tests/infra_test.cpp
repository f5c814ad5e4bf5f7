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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (Logger, WorkerPool).
 */

#include "chronid/infra/logger.hpp"
#include "chronid/infra/worker_pool.hpp"
#include "framework.hpp"

#include <atomic>
#include <stdexcept>

using chronid::infra::Logger;
using chronid::infra::LogLevel;
using chronid::infra::WorkerPool;

/**
 * @brief Level names parse case-insensitively; unknown names are rejected.
 */
void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("WARN") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("Warning") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("fatal") == LogLevel::FATAL);
    ASSERT_FALSE(Logger::parse_level("verbose").has_value());
    ASSERT_FALSE(Logger::parse_level("").has_value());
}

/**
 * @brief The threshold gates which severities are emitted.
 */
void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    Logger::set_level(LogLevel::TRACE);
    ASSERT_TRUE(Logger::enabled(LogLevel::TRACE));

    Logger::set_level(saved);
}

/**
 * @brief Every submitted task runs before `wait_idle` returns.
 */
void test_worker_pool_runs_all_tasks()
{
    std::atomic<int> counter{0};
    WorkerPool pool(4);

    for (int i = 0; i < 1000; ++i) {
        pool.submit([&counter] { counter.fetch_add(1); });
    }
    pool.wait_idle();

    ASSERT_EQ(counter.load(), 1000);
}

/**
 * @brief A throwing task is reported once through `wait_idle`; the pool
 * keeps serving later tasks.
 */
void test_worker_pool_propagates_task_failure()
{
    std::atomic<int> counter{0};
    WorkerPool pool(2);

    pool.submit([] { throw std::runtime_error("task failed"); });
    ASSERT_THROWS(std::runtime_error, pool.wait_idle());

    pool.submit([&counter] { counter.fetch_add(1); });
    pool.wait_idle();
    ASSERT_EQ(counter.load(), 1);
}

/**
 * @brief Zero requested threads still yields a working pool; destruction
 * drains queued work.
 */
void test_worker_pool_minimum_size_and_drain()
{
    std::atomic<int> counter{0};
    {
        WorkerPool pool(0);
        ASSERT_EQ(pool.size(), static_cast<size_t>(1));
        for (int i = 0; i < 100; ++i) {
            pool.submit([&counter] { counter.fetch_add(1); });
        }
    }
    ASSERT_EQ(counter.load(), 100);
}
