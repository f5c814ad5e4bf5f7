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
 * @file random_test.cpp
 * @brief Tests for the kernel random source and the version 4 generator.
 */

#include "chronid/core/errors.hpp"
#include "chronid/core/random_generator.hpp"
#include "chronid/core/random_source.hpp"
#include "fakes.hpp"
#include "framework.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

using chronid::core::Identifier;
using chronid::core::RandomGenerator;
using chronid::core::SecureRandomSource;

/**
 * @brief Requested lengths are honoured exactly, including zero and
 * lengths above the single-call getrandom limit.
 */
void test_secure_random_lengths()
{
    SecureRandomSource random;
    ASSERT_EQ(random.next_bytes(0).size(), static_cast<size_t>(0));
    ASSERT_EQ(random.next_bytes(6).size(), static_cast<size_t>(6));
    ASSERT_EQ(random.next_bytes(1 << 20).size(), static_cast<size_t>(1 << 20));
}

/**
 * @brief Successive integers are not stuck on one value.
 */
void test_secure_random_integers_vary()
{
    SecureRandomSource random;
    std::unordered_set<std::int32_t> values;
    for (int i = 0; i < 32; ++i) {
        values.insert(random.next_int());
    }
    ASSERT_TRUE(values.size() > 1);
}

/**
 * @brief Text form follows `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`.
 */
void test_random_generator_format()
{
    RandomGenerator generator;
    for (int i = 0; i < 1000; ++i) {
        std::string text = generator.next_id().to_string();
        ASSERT_EQ(text.length(), Identifier::kTextLength);
        ASSERT_EQ(text[14], '4');
        char y = text[19];
        ASSERT_TRUE(y == '8' || y == '9' || y == 'a' || y == 'b');
    }
}

/**
 * @brief Sequential invocations do not collide.
 */
void test_random_generator_uniqueness()
{
    RandomGenerator generator;
    std::unordered_set<Identifier> seen;
    for (int i = 0; i < 10000; ++i) {
        seen.insert(generator.next_id());
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(10000));
}

/**
 * @brief Scripted bytes pass through apart from the version and variant bits.
 */
void test_random_generator_stamps_bits()
{
    auto random = std::make_shared<chronid::test::ScriptedRandomSource>(
        std::vector<std::uint8_t>(16, 0xFF), std::vector<std::int32_t>{});
    RandomGenerator generator(random);

    ASSERT_EQ(generator.next_id().to_string(), std::string("ffffffff-ffff-4fff-bfff-ffffffffffff"));
    ASSERT_THROWS(chronid::core::EntropyExhaustion, generator.next_id());
}

void test_random_generator_rejects_null_source()
{
    ASSERT_THROWS(chronid::core::ConstructionError, RandomGenerator(nullptr));
}
