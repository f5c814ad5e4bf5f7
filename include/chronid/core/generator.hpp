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
 * @file generator.hpp
 * @brief Common interface of all identifier generators.
 */

#pragma once

#include "chronid/core/identifier.hpp"

namespace chronid::core {

/**
 * @class Generator
 * @brief Produces identifiers on demand.
 *
 * @details
 * Implementations are safe to share between threads of one process.
 */
class Generator {
  public:
    virtual ~Generator() = default;

    /**
     * @brief Returns a new identifier.
     * @throws EntropyExhaustion If the generator's randomness source fails.
     */
    virtual Identifier next_id() = 0;
};

} // namespace chronid::core
