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
 * @file node_test.cpp
 * @brief Unit tests for node identifier derivation.
 */

#include "chronid/core/errors.hpp"
#include "chronid/core/node.hpp"
#include "fakes.hpp"
#include "framework.hpp"

#include <cstdint>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <vector>

using chronid::core::NodeIdentifier;
using chronid::test::ScriptedRandomSource;

namespace {

const std::vector<std::uint8_t> kRandomBytes = {0x2A, 0x11, 0x66, 0x77, 0x88, 0x99};

} // namespace

/**
 * @brief A resolved IPv4 address replaces bytes 2..5; bytes 0..1 stay random.
 */
void test_node_embeds_ipv4_address()
{
    ScriptedRandomSource random(kRandomBytes, {});
    NodeIdentifier node =
        chronid::core::derive_node(random, chronid::test::fixed_address({10, 0, 0, 42}));

    NodeIdentifier expected = {0xAA, 0x11, 10, 0, 0, 42};
    ASSERT_TRUE(node == expected);
}

/**
 * @brief A failed lookup keeps all six random bytes, with the marker bit set.
 */
void test_node_random_fallback()
{
    ScriptedRandomSource random(kRandomBytes, {});
    NodeIdentifier node = chronid::core::derive_node(random, chronid::test::no_address());

    NodeIdentifier expected = {0xAA, 0x11, 0x66, 0x77, 0x88, 0x99};
    ASSERT_TRUE(node == expected);
}

/**
 * @brief Addresses that are not exactly four bytes (IPv6) are ignored, as is
 * an empty resolver.
 */
void test_node_ignores_non_ipv4()
{
    std::vector<std::uint8_t> ipv6(16, 0xFE);
    NodeIdentifier expected = {0xAA, 0x11, 0x66, 0x77, 0x88, 0x99};

    ScriptedRandomSource first(kRandomBytes, {});
    ASSERT_TRUE(chronid::core::derive_node(first, chronid::test::fixed_address(ipv6)) == expected);

    ScriptedRandomSource second(kRandomBytes, {});
    ASSERT_TRUE(chronid::core::derive_node(second, chronid::core::AddressResolver()) == expected);
}

/**
 * @brief The marker bit is set even when the random byte already has it.
 */
void test_node_marker_bit_always_set()
{
    for (std::uint8_t first : {std::uint8_t{0x00}, std::uint8_t{0x7F}, std::uint8_t{0xFF}}) {
        ScriptedRandomSource random({first, 0, 0, 0, 0, 0}, {});
        NodeIdentifier node = chronid::core::derive_node(random, chronid::test::no_address());
        ASSERT_TRUE((node[0] & chronid::core::kNodeMulticastBit) != 0);
        ASSERT_EQ(static_cast<int>(node[0] & 0x7F), static_cast<int>(first & 0x7F));
    }
}

/**
 * @brief A source without enough bytes surfaces EntropyExhaustion.
 */
void test_node_entropy_exhaustion()
{
    ScriptedRandomSource random({0x01, 0x02}, {});
    ASSERT_THROWS(chronid::core::EntropyExhaustion,
                  chronid::core::derive_node(random, chronid::test::no_address()));
}

/**
 * @brief On a dual-stack lookup the IPv4 entry wins even when IPv6 comes first.
 */
void test_node_first_ipv4_skips_ipv6()
{
    sockaddr_in6 v6;
    std::memset(&v6, 0, sizeof(v6));
    v6.sin6_family = AF_INET6;
    v6.sin6_addr.s6_addr[0] = 0x20;
    v6.sin6_addr.s6_addr[1] = 0x01;

    sockaddr_in v4;
    std::memset(&v4, 0, sizeof(v4));
    v4.sin_family = AF_INET;
    const std::uint8_t octets[4] = {10, 1, 2, 3};
    std::memcpy(&v4.sin_addr, octets, sizeof(octets));

    addrinfo second;
    std::memset(&second, 0, sizeof(second));
    second.ai_family = AF_INET;
    second.ai_addrlen = sizeof(v4);
    second.ai_addr = reinterpret_cast<sockaddr*>(&v4);

    addrinfo first;
    std::memset(&first, 0, sizeof(first));
    first.ai_family = AF_INET6;
    first.ai_addrlen = sizeof(v6);
    first.ai_addr = reinterpret_cast<sockaddr*>(&v6);
    first.ai_next = &second;

    auto address = chronid::core::first_ipv4_address(&first);
    ASSERT_TRUE(address.has_value());
    ASSERT_TRUE(*address == std::vector<std::uint8_t>({10, 1, 2, 3}));

    // IPv6 only, or nothing at all: no address.
    first.ai_next = nullptr;
    ASSERT_FALSE(chronid::core::first_ipv4_address(&first).has_value());
    ASSERT_FALSE(chronid::core::first_ipv4_address(nullptr).has_value());
}

/**
 * @brief The real resolver either fails cleanly or returns an IPv4 address.
 */
void test_node_local_address_lookup()
{
    auto address = chronid::core::resolve_local_address();
    if (address) {
        ASSERT_EQ(address->size(), static_cast<std::size_t>(4));
    }
}
