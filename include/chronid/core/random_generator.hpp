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
 * @file random_generator.hpp
 * @brief Random (version 4) identifier generator.
 *
 * @details
 * For callers that want identifiers carrying no host or time information.
 * 122 of the 128 bits come from the random source; the remaining six hold
 * the version and variant tags.
 */

#pragma once

#include "chronid/core/generator.hpp"
#include "chronid/core/random_source.hpp"

#include <memory>

namespace chronid::core {

/**
 * @class RandomGenerator
 * @brief Stateless generator of `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` identifiers.
 *
 * Thread safety is that of the supplied `RandomSource`; the default
 * `SecureRandomSource` is safe to share.
 */
class RandomGenerator : public Generator {
  public:
    RandomGenerator();

    /// @throws ConstructionError If `random` is null.
    explicit RandomGenerator(std::shared_ptr<RandomSource> random);

    /**
     * @brief Draws 16 bytes and stamps the version and variant bits.
     *
     * - Byte 6: top nibble forced to `0100`.
     * - Byte 8: top two bits forced to `10`.
     */
    Identifier next_id() override;

  private:
    std::shared_ptr<RandomSource> random_;
};

} // namespace chronid::core
