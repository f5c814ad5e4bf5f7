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
 * @file errors.hpp
 * @brief Exception types raised by the identifier generators.
 *
 * @details
 * Only two conditions ever escape the core: a generator wired with a missing
 * collaborator, and a randomness source that can no longer produce data.
 * Clock regressions and host lookup failures are absorbed internally.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chronid::core {

/**
 * @class ConstructionError
 * @brief Thrown when a generator is built with a null required collaborator.
 *
 * No generator object exists after this is thrown.
 */
class ConstructionError : public std::runtime_error {
  public:
    explicit ConstructionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class EntropyExhaustion
 * @brief Thrown when a `RandomSource` fails to deliver the requested data.
 *
 * Fatal for the operation that triggered it. Nothing is returned and the
 * caller decides whether the process can continue.
 */
class EntropyExhaustion : public std::runtime_error {
  public:
    explicit EntropyExhaustion(const std::string& what) : std::runtime_error(what) {}
};

} // namespace chronid::core
