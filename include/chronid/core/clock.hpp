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
 * @file clock.hpp
 * @brief Wall clock abstraction used by the time-based generator.
 */

#pragma once

#include <cstdint>

namespace chronid::core {

/**
 * @class Clock
 * @brief Source of wall-clock time in milliseconds since the Unix epoch.
 *
 * @details
 * The value is allowed to move backwards (NTP steps, manual changes). The
 * generator detects that and reseeds; a clock implementation must not try
 * to hide it.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Current time in milliseconds since 1970-01-01T00:00:00Z.
    virtual std::int64_t now_ms() const = 0;
};

/**
 * @class SystemClock
 * @brief `Clock` reading `std::chrono::system_clock`.
 */
class SystemClock : public Clock {
  public:
    std::int64_t now_ms() const override;
};

} // namespace chronid::core
