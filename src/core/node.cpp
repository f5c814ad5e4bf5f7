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
 * @file node.cpp
 * @brief Host address lookup and node identifier derivation.
 */

#include "chronid/core/node.hpp"

#include "chronid/core/errors.hpp"
#include "chronid/core/random_source.hpp"
#include "chronid/infra/logger.hpp"

#include <algorithm>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace chronid::core {

std::optional<std::vector<std::uint8_t>> first_ipv4_address(const ::addrinfo* list)
{
    for (const ::addrinfo* entry = list; entry != nullptr; entry = entry->ai_next) {
        if (entry->ai_family != AF_INET || entry->ai_addr == nullptr) {
            continue;
        }
        const auto* sin = reinterpret_cast<const sockaddr_in*>(entry->ai_addr);
        const auto* raw = reinterpret_cast<const std::uint8_t*>(&sin->sin_addr);
        return std::vector<std::uint8_t>(raw, raw + 4);
    }
    return std::nullopt;
}

std::optional<std::vector<std::uint8_t>> resolve_local_address()
{
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0) {
        return std::nullopt;
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &result) != 0 || result == nullptr) {
        return std::nullopt;
    }

    std::optional<std::vector<std::uint8_t>> address = first_ipv4_address(result);
    ::freeaddrinfo(result);
    return address;
}

NodeIdentifier derive_node(RandomSource& random, const AddressResolver& resolver)
{
    std::vector<std::uint8_t> seed = random.next_bytes(6);
    if (seed.size() != 6) {
        throw EntropyExhaustion("random source returned " + std::to_string(seed.size()) +
                                " bytes, expected 6");
    }

    NodeIdentifier node{};
    std::copy(seed.begin(), seed.end(), node.begin());

    std::optional<std::vector<std::uint8_t>> address;
    if (resolver) {
        address = resolver();
    }

    if (address && address->size() == 4) {
        std::copy(address->begin(), address->end(), node.begin() + 2);
    } else {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Node: No IPv4 host address available, using random node bytes");
    }

    node[0] |= kNodeMulticastBit;
    return node;
}

} // namespace chronid::core
