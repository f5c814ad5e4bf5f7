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
 * @file random_source.cpp
 * @brief Kernel-backed implementation of the `RandomSource` capability.
 */

#include "chronid/core/random_source.hpp"

#include "chronid/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/random.h>

namespace chronid::core {

/**
 * @brief Fills a buffer of `n` bytes from `getrandom(2)`.
 *
 * The syscall may return fewer bytes than requested for large buffers or be
 * interrupted by a signal; both cases simply continue from the current
 * offset. Any other failure is unrecoverable for the caller.
 */
std::vector<std::uint8_t> SecureRandomSource::next_bytes(std::size_t n)
{
    std::vector<std::uint8_t> buf(n);
    std::size_t filled = 0;

    while (filled < n) {
        ssize_t got = ::getrandom(buf.data() + filled, n - filled, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw EntropyExhaustion("getrandom failed: " + std::string(std::strerror(errno)));
        }
        if (got == 0) {
            throw EntropyExhaustion("getrandom returned no data");
        }
        filled += static_cast<std::size_t>(got);
    }

    return buf;
}

std::int32_t SecureRandomSource::next_int()
{
    std::vector<std::uint8_t> raw = next_bytes(4);

    std::uint32_t value = (static_cast<std::uint32_t>(raw[0]) << 24) |
                          (static_cast<std::uint32_t>(raw[1]) << 16) |
                          (static_cast<std::uint32_t>(raw[2]) << 8) |
                          static_cast<std::uint32_t>(raw[3]);

    return static_cast<std::int32_t>(value);
}

} // namespace chronid::core
