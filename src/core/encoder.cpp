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
 * @file encoder.cpp
 * @brief Implementation of the version 1 field layout.
 */

#include "chronid/core/encoder.hpp"

#include <algorithm>

namespace chronid::core {

namespace {

/// Writes the `len` low-order bytes of `value` big-endian at `offset`.
void put_be(Identifier::Bytes& out, std::size_t offset, std::size_t len, std::uint64_t value)
{
    for (std::size_t i = len; i-- > 0;) {
        out[offset + i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

std::uint64_t get_be(const Identifier::Bytes& in, std::size_t offset, std::size_t len)
{
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < len; ++i) {
        value = (value << 8) | in[offset + i];
    }
    return value;
}

} // namespace

Fields Encoder::time_based(std::uint64_t simulated_time, std::uint16_t clock_sequence,
                           const NodeIdentifier& node)
{
    Fields f;
    f.time_low = static_cast<std::uint32_t>(simulated_time & 0xFFFFFFFFULL);
    f.time_mid = static_cast<std::uint16_t>((simulated_time >> 32) & 0xFFFF);
    f.time_hi_and_version =
        static_cast<std::uint16_t>(((simulated_time >> 48) & kTimeHiMask) | kVersionTimeBased);
    f.clock_seq = static_cast<std::uint16_t>((clock_sequence & kClockSequenceMask) | kVariantRfc4122);
    f.node = node;
    return f;
}

Identifier Encoder::pack(const Fields& fields)
{
    Identifier::Bytes bytes{};
    put_be(bytes, 0, 4, fields.time_low);
    put_be(bytes, 4, 2, fields.time_mid);
    put_be(bytes, 6, 2, fields.time_hi_and_version);
    put_be(bytes, 8, 2, fields.clock_seq);
    std::copy(fields.node.begin(), fields.node.end(), bytes.begin() + 10);
    return Identifier(bytes);
}

Fields Encoder::unpack(const Identifier& id)
{
    const Identifier::Bytes& bytes = id.bytes();

    Fields f;
    f.time_low = static_cast<std::uint32_t>(get_be(bytes, 0, 4));
    f.time_mid = static_cast<std::uint16_t>(get_be(bytes, 4, 2));
    f.time_hi_and_version = static_cast<std::uint16_t>(get_be(bytes, 6, 2));
    f.clock_seq = static_cast<std::uint16_t>(get_be(bytes, 8, 2));
    std::copy(bytes.begin() + 10, bytes.end(), f.node.begin());
    return f;
}

std::uint64_t Encoder::simulated_time(const Fields& fields)
{
    return (static_cast<std::uint64_t>(fields.time_hi_and_version & kTimeHiMask) << 48) |
           (static_cast<std::uint64_t>(fields.time_mid) << 32) | fields.time_low;
}

} // namespace chronid::core
