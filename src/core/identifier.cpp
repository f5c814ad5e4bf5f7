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
 * @file identifier.cpp
 * @brief Text rendering and parsing of `Identifier` values.
 */

#include "chronid/core/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace chronid::core {

namespace {

/// Byte offsets after which a hyphen is emitted.
constexpr std::size_t kGroupEnds[] = {4, 6, 8, 10};

/// Character positions of the hyphens in the text form.
constexpr std::size_t kHyphenPositions[] = {8, 13, 18, 23};

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::optional<Identifier> Identifier::parse(std::string_view text)
{
    text = trim(text);
    if (text.size() != kTextLength) {
        return std::nullopt;
    }

    for (std::size_t pos : kHyphenPositions) {
        if (text[pos] != '-') {
            return std::nullopt;
        }
    }

    Bytes bytes{};
    std::size_t out = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (std::find(std::begin(kHyphenPositions), std::end(kHyphenPositions), i) !=
            std::end(kHyphenPositions)) {
            ++i;
            continue;
        }

        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes[out++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return Identifier(bytes);
}

std::string Identifier::to_string() const
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < bytes_.size(); ++i) {
        if (std::find(std::begin(kGroupEnds), std::end(kGroupEnds), i) != std::end(kGroupEnds)) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<unsigned>(bytes_[i]);
    }

    return ss.str();
}

Variant Identifier::variant() const
{
    std::uint8_t b = bytes_[8];
    if ((b & 0x80) == 0) {
        return Variant::NCS;
    }
    if ((b & 0xC0) == 0x80) {
        return Variant::RFC4122;
    }
    if ((b & 0xE0) == 0xC0) {
        return Variant::MICROSOFT;
    }
    return Variant::FUTURE;
}

bool Identifier::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::ostream& operator<<(std::ostream& out, const Identifier& id)
{
    return out << id.to_string();
}

const char* variant_name(Variant variant)
{
    switch (variant) {
    case Variant::NCS:
        return "ncs";
    case Variant::RFC4122:
        return "rfc4122";
    case Variant::MICROSOFT:
        return "microsoft";
    case Variant::FUTURE:
        return "future";
    }
    return "unknown";
}

} // namespace chronid::core
