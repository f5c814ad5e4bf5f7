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
 * @file time_generator.hpp
 * @brief Time-based (version 1) identifier generator.
 *
 * @details
 * Declares `TimeGenerator`, the primary key source of chronid. Each identifier
 * combines a simulated 100 ns timestamp, a clock sequence and a per-instance
 * node value. The millisecond wall clock is stretched to 100 ns resolution by
 * a counter that advances on every call landing in the same millisecond.
 */

#pragma once

#include "chronid/core/clock.hpp"
#include "chronid/core/generator.hpp"
#include "chronid/core/node.hpp"
#include "chronid/core/random_source.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace chronid::core {

/**
 * @struct ClockState
 * @brief Mutable timing state of one generator; only touched under its mutex.
 *
 * `clock_seq` does double duty: `clock_seq % 10000` is the sub-millisecond
 * tick and `(clock_seq / 10000) & 0x3FFF` is the clock sequence written into
 * the identifier. Unsigned so that incrementing past the top wraps to zero.
 */
struct ClockState {
    std::int64_t last_timestamp_ms = 0;
    std::uint32_t clock_seq = 0;
};

/**
 * @class TimeGenerator
 * @brief Thread-safe generator of version 1 identifiers.
 *
 * @details
 * **Per call** (`next_id`), under one exclusive lock:
 * - Clock behind the last reading: `clock_seq` is reseeded from the random
 *   source, the old sequence is considered untrustworthy.
 * - Same millisecond: `clock_seq` is incremented.
 * - Later millisecond: `clock_seq` is kept.
 *
 * That gives 10,000 sub-millisecond slots times 16,384 clock sequence
 * values per millisecond.
 *
 * @warning The 14-bit clock sequence is not guarded against wrapping. Once
 * more than ~1.6e8 identifiers are requested within a single millisecond
 * reading, earlier identifiers repeat.
 *
 * Instances never share state; two generators in one process have
 * independent nodes and clock states.
 */
class TimeGenerator : public Generator {
  public:
    /**
     * @brief Builds a generator over the kernel CSPRNG, the system clock and
     * the host's resolved address.
     *
     * @throws EntropyExhaustion If the seed material cannot be read.
     */
    TimeGenerator();

    /**
     * @brief Builds a generator over a caller-supplied random source.
     *
     * @param random Must not be null.
     * @throws ConstructionError If `random` is null.
     * @throws EntropyExhaustion Propagated from `random`.
     */
    explicit TimeGenerator(std::shared_ptr<RandomSource> random);

    /**
     * @brief Builds a generator with every collaborator injected.
     *
     * The constructor reads the clock once, draws six node bytes and one
     * integer seed from `random`, and invokes `resolver` once.
     *
     * @param random Randomness for the node and clock sequence. Must not be null.
     * @param clock Wall clock. Must not be null.
     * @param resolver Host address lookup; an empty function counts as failure.
     * @throws ConstructionError If `random` or `clock` is null.
     */
    TimeGenerator(std::shared_ptr<RandomSource> random, std::shared_ptr<Clock> clock,
                  AddressResolver resolver);

    TimeGenerator(const TimeGenerator&) = delete;
    TimeGenerator& operator=(const TimeGenerator&) = delete;

    Identifier next_id() override;

    /// @brief The node written into every identifier of this instance.
    const NodeIdentifier& node() const { return node_; }

  private:
    std::shared_ptr<RandomSource> random_;
    std::shared_ptr<Clock> clock_;
    NodeIdentifier node_{};

    std::mutex state_mutex_;
    ClockState state_; ///< Guarded by `state_mutex_`.
};

} // namespace chronid::core
