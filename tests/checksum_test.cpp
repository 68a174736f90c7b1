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
 * @file checksum_test.cpp
 * @brief Unit tests for the weighted modulo 11 check digit.
 *
 * @details
 * Covers the three reduction branches: a regular digit (1..9), the wrap to 0
 * (result 11), and the prohibited result 10.
 */

#include "swissuid/core/checksum.hpp"
#include "framework.hpp"

using swissuid::core::Checksum;
using swissuid::core::Digits;

/**
 * @brief 109.322.55 -> weighted sum 109, 11 - (109 mod 11) = 1.
 */
void test_checksum_known_value()
{
    const Digits digits = {1, 0, 9, 3, 2, 2, 5, 5};
    ASSERT_EQ(Checksum::weighted_sum(digits), static_cast<std::uint32_t>(109));

    const auto check = Checksum::compute(digits);
    ASSERT_TRUE(check.has_value());
    ASSERT_EQ(static_cast<int>(*check), 1);
}

/**
 * @brief A sum divisible by 11 reduces to 11, which maps to check digit 0.
 */
void test_checksum_wraps_to_zero()
{
    // 1*5 + 1*6 = 11
    const Digits digits = {1, 0, 0, 0, 0, 1, 0, 0};
    const auto check = Checksum::compute(digits);
    ASSERT_TRUE(check.has_value());
    ASSERT_EQ(static_cast<int>(*check), 0);

    const Digits zeros = {0, 0, 0, 0, 0, 0, 0, 0};
    ASSERT_EQ(static_cast<int>(*Checksum::compute(zeros)), 0);
}

/**
 * @brief 000.002.00 -> sum 12, 11 - 1 = 10: no check digit exists.
 */
void test_checksum_prohibited_payload()
{
    const Digits digits = {0, 0, 0, 0, 0, 2, 0, 0};
    ASSERT_FALSE(Checksum::compute(digits).has_value());
    ASSERT_FALSE(Checksum::is_issuable(digits));

    const Digits valid = {1, 0, 0, 0, 0, 2, 0, 0};
    ASSERT_EQ(static_cast<int>(*Checksum::compute(valid)), 5);
    ASSERT_TRUE(Checksum::is_issuable(valid));
}

void test_checksum_deterministic()
{
    const Digits digits = {4, 7, 1, 9, 0, 3, 8, 6};
    ASSERT_TRUE(Checksum::compute(digits) == Checksum::compute(digits));
}

/**
 * @brief Exhaustive over one varying digit: results stay in [0, 9] or are empty,
 * and exactly the sums with remainder 1 are prohibited.
 */
void test_checksum_range()
{
    Digits digits = {1, 2, 3, 4, 5, 6, 7, 0};
    for (std::uint8_t last = 0; last <= 9; ++last) {
        digits[7] = last;
        const auto check = Checksum::compute(digits);
        const bool prohibited = Checksum::weighted_sum(digits) % 11 == 1;
        ASSERT_EQ(check.has_value(), !prohibited);
        if (check) {
            ASSERT_TRUE(*check <= 9);
        }
    }
}
