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
 * @file time_generator.cpp
 * @brief Implementation of the version 1 generation algorithm.
 *
 * @details
 * The only state is the `ClockState` pair. Everything else (node, random
 * source, clock) is fixed at construction, so the critical section in
 * `next_id` covers a clock read, a handful of integer operations and, on a
 * clock regression, a single random draw.
 */

#include "chronid/core/time_generator.hpp"

#include "chronid/core/encoder.hpp"
#include "chronid/core/errors.hpp"
#include "chronid/infra/logger.hpp"

#include <string>
#include <utility>

namespace chronid::core {

namespace {

template <typename T> std::shared_ptr<T> require(std::shared_ptr<T> ptr, const char* what)
{
    if (!ptr) {
        throw ConstructionError(std::string("TimeGenerator requires a non-null ") + what);
    }
    return ptr;
}

/// Magnitude of a random int; INT32_MIN maps to 2^31 instead of overflowing.
std::uint32_t magnitude(std::int32_t value)
{
    return value < 0 ? static_cast<std::uint32_t>(-static_cast<std::int64_t>(value))
                     : static_cast<std::uint32_t>(value);
}

} // namespace

TimeGenerator::TimeGenerator() : TimeGenerator(std::make_shared<SecureRandomSource>()) {}

TimeGenerator::TimeGenerator(std::shared_ptr<RandomSource> random)
    : TimeGenerator(std::move(random), std::make_shared<SystemClock>(), resolve_local_address)
{
}

TimeGenerator::TimeGenerator(std::shared_ptr<RandomSource> random, std::shared_ptr<Clock> clock,
                             AddressResolver resolver)
    : random_(require(std::move(random), "random source")),
      clock_(require(std::move(clock), "clock"))
{
    node_ = derive_node(*random_, resolver);

    state_.last_timestamp_ms = clock_->now_ms();
    state_.clock_seq = magnitude(random_->next_int());

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "TimeGenerator: Initialized with clock sequence seed " +
                           std::to_string(state_.clock_seq));
}

/**
 * @brief Produces the next identifier.
 *
 * Steps inside the lock:
 * 1. Compare the clock reading against the last one and adjust `clock_seq`.
 * 2. `simulated = ms * 10000 + clock_seq % 10000`.
 * 3. `sequence = clock_seq / 10000`, truncated to 14 bits by the encoder.
 * 4. Pack with the instance node.
 *
 * A clock regression is only recorded under the lock and logged after it is
 * released.
 */
Identifier TimeGenerator::next_id()
{
    Identifier id;
    std::int64_t regression_ms = 0;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        std::int64_t now = clock_->now_ms();

        if (now < state_.last_timestamp_ms) {
            regression_ms = state_.last_timestamp_ms - now;
            state_.clock_seq = magnitude(random_->next_int());
        } else if (now == state_.last_timestamp_ms) {
            ++state_.clock_seq;
        }
        state_.last_timestamp_ms = now;

        std::uint64_t simulated = static_cast<std::uint64_t>(now) *
                                      static_cast<std::uint64_t>(Encoder::kTicksPerMillisecond) +
                                  state_.clock_seq % Encoder::kTicksPerMillisecond;
        auto sequence = static_cast<std::uint16_t>(
            (state_.clock_seq / Encoder::kTicksPerMillisecond) & Encoder::kClockSequenceMask);

        id = Encoder::pack(Encoder::time_based(simulated, sequence, node_));
    }

    if (regression_ms > 0) {
        infra::Logger::log(infra::LogLevel::WARN, "TimeGenerator: Clock moved backwards by " +
                                                      std::to_string(regression_ms) +
                                                      " ms, reseeded clock sequence");
    }

    return id;
}

} // namespace chronid::core
