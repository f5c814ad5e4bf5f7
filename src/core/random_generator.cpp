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
 * @file random_generator.cpp
 * @brief Implementation of RFC 4122 version 4 generation.
 */

#include "chronid/core/random_generator.hpp"

#include "chronid/core/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace chronid::core {

RandomGenerator::RandomGenerator() : random_(std::make_shared<SecureRandomSource>()) {}

RandomGenerator::RandomGenerator(std::shared_ptr<RandomSource> random) : random_(std::move(random))
{
    if (!random_) {
        throw ConstructionError("RandomGenerator requires a non-null random source");
    }
}

Identifier RandomGenerator::next_id()
{
    std::vector<std::uint8_t> raw = random_->next_bytes(16);
    if (raw.size() != 16) {
        throw EntropyExhaustion("random source returned " + std::to_string(raw.size()) +
                                " bytes, expected 16");
    }

    Identifier::Bytes bytes{};
    std::copy(raw.begin(), raw.end(), bytes.begin());

    // Group 3: force the high nibble to '4' (Version 4: Random).
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);

    // Group 4: force the high bits to '10' (Variant 1: RFC 4122).
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    return Identifier(bytes);
}

} // namespace chronid::core
