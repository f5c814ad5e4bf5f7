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
 * @file random_source.hpp
 * @brief Randomness capability consumed by the identifier generators.
 *
 * @details
 * Generators never talk to an entropy device directly. They read bytes and
 * integers through the `RandomSource` interface so that tests (or embedding
 * applications) can substitute a deterministic or hardware-backed source.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chronid::core {

/**
 * @class RandomSource
 * @brief Abstract supplier of random bytes and random 32-bit integers.
 *
 * @details
 * Implementations shared between generators must be safe to call from
 * several threads at once. Failure to produce data must be reported by
 * throwing `EntropyExhaustion`, never by returning short or zeroed output.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Produces exactly `n` random bytes.
     * @throws EntropyExhaustion If the underlying source cannot deliver.
     */
    virtual std::vector<std::uint8_t> next_bytes(std::size_t n) = 0;

    /**
     * @brief Produces a uniformly distributed signed 32-bit integer.
     * @throws EntropyExhaustion If the underlying source cannot deliver.
     */
    virtual std::int32_t next_int() = 0;
};

/**
 * @class SecureRandomSource
 * @brief Default `RandomSource` backed by the kernel CSPRNG.
 *
 * @details
 * Reads from `getrandom(2)` in blocking mode, so it waits for the entropy
 * pool to be initialized once at boot and never afterwards. Interrupted and
 * partial reads are resumed. Stateless, hence thread-safe.
 */
class SecureRandomSource : public RandomSource {
  public:
    std::vector<std::uint8_t> next_bytes(std::size_t n) override;
    std::int32_t next_int() override;
};

} // namespace chronid::core
