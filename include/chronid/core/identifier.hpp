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
 * @file identifier.hpp
 * @brief 128-bit identifier value type.
 *
 * @details
 * `Identifier` is an immutable 16-byte value laid out as
 * `time_low(4) | time_mid(2) | time_hi_and_version(2) | clock_seq(2) | node(6)`,
 * all fields big-endian. It carries no knowledge of how it was produced; the
 * field semantics live in `Encoder`.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace chronid::core {

/**
 * @enum Variant
 * @brief Layout family encoded in the high bits of byte 8.
 */
enum class Variant {
    NCS,       ///< `0xx`: reserved, NCS backward compatibility.
    RFC4122,   ///< `10x`: the layout produced by this library.
    MICROSOFT, ///< `110`: reserved, Microsoft backward compatibility.
    FUTURE     ///< `111`: reserved for future definition.
};

/**
 * @class Identifier
 * @brief A 16-byte unique identifier with canonical text rendering.
 *
 * @details
 * A default-constructed identifier is the nil value (all zero bytes).
 * Ordering compares bytes lexicographically, which for time-based
 * identifiers is *not* chronological (time_low comes first).
 */
class Identifier {
  public:
    using Bytes = std::array<std::uint8_t, 16>;

    /// @brief Length of the hyphenated text form.
    static constexpr std::size_t kTextLength = 36;

    Identifier() = default;

    explicit Identifier(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parses the canonical `8-4-4-4-12` hexadecimal form.
     *
     * Leading and trailing whitespace is ignored and hex digits may be of
     * either case. Braces, URN prefixes and the unhyphenated form are
     * rejected.
     *
     * @param text The candidate string.
     * @return The identifier, or `std::nullopt` if `text` is malformed.
     *
     * @code
     * auto id = Identifier::parse("f12e9a86-6568-103c-b039-aa1122334455");
     * if (id) { use(*id); }
     * @endcode
     */
    static std::optional<Identifier> parse(std::string_view text);

    /// @brief The raw 16-byte layout.
    const Bytes& bytes() const { return bytes_; }

    /// @brief Lowercase hyphenated hex, e.g. `a1b2c3d4-e5f6-1789-9abc-def012345678`.
    std::string to_string() const;

    /// @brief Version number held in the top nibble of byte 6.
    int version() const { return bytes_[6] >> 4; }

    /// @brief Layout variant held in the top bits of byte 8.
    Variant variant() const;

    bool is_nil() const;

    friend bool operator==(const Identifier& a, const Identifier& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Identifier& a, const Identifier& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Identifier& a, const Identifier& b) { return a.bytes_ < b.bytes_; }

  private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& out, const Identifier& id);

/// @brief Lowercase name of a variant ("rfc4122", "ncs", ...).
const char* variant_name(Variant variant);

} // namespace chronid::core

namespace std {

template <> struct hash<chronid::core::Identifier> {
    std::size_t operator()(const chronid::core::Identifier& id) const noexcept
    {
        // FNV-1a over all 16 bytes.
        std::uint64_t h = 14695981039346656037ULL;
        for (std::uint8_t b : id.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<std::size_t>(h);
    }
};

} // namespace std
