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
 * @file id_generator.hpp
 * @brief Entropy source for synthesizing identifier payloads.
 *
 * @details
 * This file declares the `IdGenerator` class, a stateless utility producing
 * uniformly distributed decimal digits. `core::Uid::generate` draws its
 * 8-digit payload from here and leaves the check digit to the checksum engine.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace swissuid::infra {

/**
 * @class IdGenerator
 * @brief A static utility for drawing random decimal digits.
 *
 * @details
 * Each thread owns its own engine, so concurrent callers never contend.
 */
class IdGenerator {
  public:
    /// @brief Number of digits in a UID payload (check digit excluded).
    static constexpr std::size_t PAYLOAD_DIGITS = 8;

    /**
     * @brief Draws one digit uniformly from the closed range [min, max].
     *
     * @param min Lowest digit (inclusive), at most `max`.
     * @param max Highest digit (inclusive), at most 9.
     */
    static std::uint8_t digit(std::uint8_t min, std::uint8_t max);

    /**
     * @brief Draws a fresh UID payload.
     *
     * The first digit is drawn from [1, 9] so that generated identifiers never
     * start with a zero; the remaining seven are drawn from [0, 9].
     *
     * @code
     * // Example Usage:
     * auto digits = swissuid::infra::IdGenerator::payload(); // e.g. {1,0,9,3,2,2,5,5}
     * @endcode
     */
    static std::array<std::uint8_t, PAYLOAD_DIGITS> payload();
};

} // namespace swissuid::infra
