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
 * @file encoder.hpp
 * @brief Field-level packing and unpacking of time-based identifiers.
 *
 * @details
 * The encoder is pure: it holds no state and performs no I/O. The time-based
 * generator feeds it a 60-bit simulated timestamp, a 14-bit clock sequence
 * and the node, and receives the finished 16-byte identifier.
 *
 * **Simulated time**
 * The wall clock only offers milliseconds. The timestamp written into an
 * identifier is `ms_since_unix_epoch * 10000 + tick`, where `tick` (0..9999)
 * stands in for the 100 ns intervals a finer clock would have provided.
 */

#pragma once

#include "chronid/core/identifier.hpp"
#include "chronid/core/node.hpp"

#include <cstdint>

namespace chronid::core {

/**
 * @struct Fields
 * @brief The five logical fields of an identifier, in wire order.
 */
struct Fields {
    std::uint32_t time_low = 0;
    std::uint16_t time_mid = 0;
    std::uint16_t time_hi_and_version = 0;
    std::uint16_t clock_seq = 0; ///< Variant bits included.
    NodeIdentifier node{};
};

/**
 * @class Encoder
 * @brief Static packing rules for the version 1 layout.
 */
class Encoder {
  public:
    static constexpr std::uint16_t kVersionTimeBased = 0x1000;
    static constexpr std::uint16_t kVersionRandom = 0x4000;
    static constexpr std::uint16_t kVariantRfc4122 = 0x8000;

    static constexpr std::uint16_t kTimeHiMask = 0x0FFF;
    static constexpr std::uint16_t kClockSequenceMask = 0x3FFF;

    /// @brief Sub-millisecond ticks (100 ns units) per millisecond.
    static constexpr std::int64_t kTicksPerMillisecond = 10000;

    /**
     * @brief Splits a simulated timestamp and clock sequence into fields.
     *
     * - `time_low`: bits 0..31 of `simulated_time`.
     * - `time_mid`: bits 32..47.
     * - `time_hi_and_version`: bits 48..59 under the version nibble `0001`.
     * - `clock_seq`: low 14 bits of `clock_sequence` under the variant `10`.
     *
     * Bits 60..63 of `simulated_time` and bits 14..15 of `clock_sequence`
     * are discarded.
     */
    static Fields time_based(std::uint64_t simulated_time, std::uint16_t clock_sequence,
                             const NodeIdentifier& node);

    /// @brief Serializes fields big-endian into the 16-byte layout.
    static Identifier pack(const Fields& fields);

    /// @brief Inverse of `pack`; never fails.
    static Fields unpack(const Identifier& id);

    /// @brief Reassembles the 60-bit timestamp from the time fields.
    static std::uint64_t simulated_time(const Fields& fields);

    /// @brief The 14-bit clock sequence with the variant bits removed.
    static std::uint16_t clock_sequence(const Fields& fields)
    {
        return fields.clock_seq & kClockSequenceMask;
    }
};

} // namespace chronid::core
