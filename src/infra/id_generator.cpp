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
 * @file id_generator.cpp
 * @brief Implementation of the random digit source.
 */

#include "swissuid/infra/id_generator.hpp"

#include <random>

namespace swissuid::infra {

namespace {

/**
 * @brief Per-thread 64-bit Mersenne Twister seeded from `std::random_device`.
 */
std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

} // namespace

std::uint8_t IdGenerator::digit(std::uint8_t min, std::uint8_t max)
{
    // uniform_int_distribution is undefined for char-sized types.
    std::uniform_int_distribution<unsigned int> dis(min, max);
    return static_cast<std::uint8_t>(dis(engine()));
}

std::array<std::uint8_t, IdGenerator::PAYLOAD_DIGITS> IdGenerator::payload()
{
    std::array<std::uint8_t, PAYLOAD_DIGITS> digits{};

    digits[0] = digit(1, 9);
    for (std::size_t i = 1; i < PAYLOAD_DIGITS; ++i) {
        digits[i] = digit(0, 9);
    }
    return digits;
}

} // namespace swissuid::infra
