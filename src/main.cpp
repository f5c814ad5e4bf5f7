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
 * @file main.cpp
 * @brief Entry point of the `chronid` command line tool.
 *
 * @details
 * The tool is a thin host around the library:
 * 1. Argument Parsing (defaults first, then overrides).
 * 2. Logger configuration.
 * 3. Either bulk generation (optionally spread over a worker pool) or
 *    inspection of an existing identifier.
 *
 * Exit codes: 0 success, 1 runtime failure or malformed identifier,
 * 2 invalid command line.
 */

#include "chronid/cli/report.hpp"
#include "chronid/core/random_generator.hpp"
#include "chronid/core/time_generator.hpp"
#include "chronid/infra/logger.hpp"
#include "chronid/infra/worker_pool.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using chronid::infra::Logger;
using chronid::infra::LogLevel;

namespace {

/// @brief Effective settings after defaults and command line overrides.
struct Options {
    std::string command = "generate";
    std::string inspect_target;
    std::size_t count = 1;
    std::size_t threads = 1;
    int version = 1;
    bool json = false;
    LogLevel log_level = LogLevel::INFO;
};

/// @brief Thrown for unusable command lines; mapped to exit code 2.
class UsageError : public std::runtime_error {
  public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "       " << binary_name << " inspect IDENTIFIER\n"
              << "Options:\n"
              << "  --count N         Number of identifiers to generate (Default: 1)\n"
              << "  --threads T       Worker threads sharing one generator (Default: 1)\n"
              << "  --version 1|4     Time-based (1) or random (4) identifiers (Default: 1)\n"
              << "  --format FORMAT   'text' (one per line) or 'json' (Default: text)\n"
              << "  --log-level LEVEL trace, debug, info, warn, error, fatal (Default: info)\n"
              << "  --help            Show this help message\n";
}

std::size_t parse_positive(const std::string& flag, const std::string& value)
{
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects a positive integer, got '" + value + "'");
    }
    if (consumed != value.size() || parsed == 0 || value.front() == '-') {
        throw UsageError(flag + " expects a positive integer, got '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

Options parse_arguments(int argc, char* argv[])
{
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--count") {
            opts.count = parse_positive(arg, value());
        } else if (arg == "--threads") {
            opts.threads = parse_positive(arg, value());
        } else if (arg == "--version") {
            std::string v = value();
            if (v != "1" && v != "4") {
                throw UsageError("--version must be 1 or 4, got '" + v + "'");
            }
            opts.version = (v == "1") ? 1 : 4;
        } else if (arg == "--format") {
            std::string f = value();
            if (f != "text" && f != "json") {
                throw UsageError("--format must be 'text' or 'json', got '" + f + "'");
            }
            opts.json = (f == "json");
        } else if (arg == "--log-level") {
            std::string l = value();
            auto level = Logger::parse_level(l);
            if (!level) {
                throw UsageError("Unknown log level '" + l + "'");
            }
            opts.log_level = *level;
        } else if (arg == "--help") {
            opts.command = "help";
        } else if (arg == "inspect") {
            opts.command = "inspect";
            opts.inspect_target = value();
        } else {
            throw UsageError("Unknown argument '" + arg + "'");
        }
    }

    return opts;
}

/**
 * @brief Generates `opts.count` identifiers from one shared generator.
 *
 * With more than one thread the range is split into contiguous slices, one
 * task per worker; each task writes only its own slice.
 */
std::vector<chronid::core::Identifier> generate(chronid::core::Generator& generator,
                                                const Options& opts)
{
    std::vector<chronid::core::Identifier> ids(opts.count);

    if (opts.threads <= 1) {
        for (auto& id : ids) {
            id = generator.next_id();
        }
        return ids;
    }

    chronid::infra::WorkerPool pool(opts.threads);
    std::size_t slice = (opts.count + pool.size() - 1) / pool.size();

    for (std::size_t begin = 0; begin < opts.count; begin += slice) {
        std::size_t end = std::min(begin + slice, opts.count);
        pool.submit([&generator, &ids, begin, end] {
            for (std::size_t i = begin; i < end; ++i) {
                ids[i] = generator.next_id();
            }
        });
    }

    pool.wait_idle();
    return ids;
}

int run_generate(const Options& opts)
{
    std::unique_ptr<chronid::core::Generator> generator;
    if (opts.version == 1) {
        generator = std::make_unique<chronid::core::TimeGenerator>();
    } else {
        generator = std::make_unique<chronid::core::RandomGenerator>();
    }

    Logger::log(LogLevel::DEBUG, "Generate: " + std::to_string(opts.count) + " version " +
                                     std::to_string(opts.version) + " identifier(s) on " +
                                     std::to_string(opts.threads) + " thread(s)");

    std::vector<chronid::core::Identifier> ids = generate(*generator, opts);

    if (opts.json) {
        std::cout << chronid::cli::Report::to_json(ids) << std::endl;
    } else {
        for (const auto& id : ids) {
            std::cout << id << '\n';
        }
        std::cout << std::flush;
    }
    return 0;
}

int run_inspect(const Options& opts)
{
    auto id = chronid::core::Identifier::parse(opts.inspect_target);
    if (!id) {
        Logger::log(LogLevel::ERROR, "Inspect: '" + opts.inspect_target +
                                         "' is not a hyphenated 8-4-4-4-12 hex identifier");
        return 1;
    }

    std::cout << chronid::cli::Report::to_json(*id) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    try {
        opts = parse_arguments(argc, argv);
    } catch (const UsageError& e) {
        Logger::log(LogLevel::ERROR, "Config: " + std::string(e.what()));
        print_help(argv[0]);
        return 2;
    }

    if (opts.command == "help") {
        print_help(argv[0]);
        return 0;
    }

    Logger::set_level(opts.log_level);

    try {
        if (opts.command == "inspect") {
            return run_inspect(opts);
        }
        return run_generate(opts);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}
