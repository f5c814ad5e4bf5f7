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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for chronid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel of the
 * library and the `chronid` tool. Output from concurrent threads is serialized
 * so entries never interleave. Messages below the configured threshold are
 * dropped before any formatting work is done.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chronid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Internal state, e.g. node derivation fallbacks and seeds.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Absorbed anomalies such as a wall clock moving backwards.
    ERROR, ///< Failed operations the process survives (bad user input).
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * **Stream Routing Logic:**
 * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
 * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
 *
 * The default threshold is `INFO`, so the library stays quiet about routine
 * internals unless the host process asks for more.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * Does nothing if `level` is below the current threshold.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * chronid::infra::Logger::log(LogLevel::WARN, "Clock moved backwards");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that is emitted.
    static void set_level(LogLevel level);

    static LogLevel level();

    /// @brief True if a message at `level` would currently be written.
    static bool enabled(LogLevel level) { return level >= threshold_.load(std::memory_order_relaxed); }

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`,
     * `fatal`), case-insensitively.
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum emitted severity.
    static std::atomic<LogLevel> threshold_;
};

} // namespace chronid::infra
