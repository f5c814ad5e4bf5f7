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
 * @file node.hpp
 * @brief Derivation of the 48-bit node field of time-based identifiers.
 *
 * @details
 * A real MAC address is not read. The node is built from random bytes with
 * the host's IPv4 address spliced into its low four bytes when the address
 * can be resolved. The multicast bit of byte 0 is always set so the value
 * can never equal a genuine IEEE 802 hardware address.
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

struct addrinfo;

namespace chronid::core {

class RandomSource;

/// @brief Six-byte node value, byte 0 first on the wire.
using NodeIdentifier = std::array<std::uint8_t, 6>;

/**
 * @brief Callable returning the raw bytes of the local host address.
 *
 * Returns `std::nullopt` when the address cannot be determined. Any byte
 * length may be returned; only a 4-byte (IPv4) result is used.
 */
using AddressResolver = std::function<std::optional<std::vector<std::uint8_t>>()>;

/// @brief Mask forced onto byte 0 to flag a non-hardware node.
constexpr std::uint8_t kNodeMulticastBit = 0x80;

/**
 * @brief Resolves the IPv4 address the local host name maps to.
 *
 * Uses `gethostname(2)` followed by an `AF_INET` `getaddrinfo(3)` query and
 * returns the first IPv4 result.
 *
 * @return The 4 address bytes, or `std::nullopt` if either lookup fails or
 * the host has no IPv4 address.
 */
std::optional<std::vector<std::uint8_t>> resolve_local_address();

/**
 * @brief Walks a `getaddrinfo` result list to its first `AF_INET` entry.
 *
 * Entries of any other family (IPv6 on dual-stack hosts) are skipped.
 *
 * @return The 4 address bytes in network order, or `std::nullopt`.
 */
std::optional<std::vector<std::uint8_t>> first_ipv4_address(const ::addrinfo* list);

/**
 * @brief Builds a node identifier for one generator instance.
 *
 * 1. Fills all six bytes from `random.next_bytes(6)`.
 * 2. Invokes `resolver`; a 4-byte result overwrites bytes 2..5.
 * 3. Forces the top bit of byte 0.
 *
 * A failed or non-IPv4 resolution keeps the fully random bytes.
 *
 * @throws EntropyExhaustion Propagated from `random`.
 */
NodeIdentifier derive_node(RandomSource& random, const AddressResolver& resolver);

} // namespace chronid::core
