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
 * @file checksum.hpp
 * @brief The UID check digit algorithm (eCH-0097, weighted modulo 11).
 *
 * @details
 * Each of the 8 payload digits is multiplied by the weight at its position,
 * `5 4 3 2 7 6 5 4`, and the products are summed. The check digit is
 * `11 - (sum mod 11)`, where 11 maps to 0. A result of 10 has no single-digit
 * representation: such payloads are never issued and every identifier built
 * on one is rejected.
 *
 * This is the only place the algorithm lives. Parsing, construction from a
 * payload and random synthesis all go through `Checksum::compute`.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace swissuid::core {

/// @brief The 8 payload digits of a UID, most significant first.
using Digits = std::array<std::uint8_t, 8>;

/**
 * @class Checksum
 * @brief Static check digit engine.
 */
class Checksum {
  public:
    /// @brief Positional multipliers.
    static constexpr std::array<std::uint8_t, 8> WEIGHTS = {5, 4, 3, 2, 7, 6, 5, 4};

    /// @brief The reduction result that has no valid check digit.
    static constexpr std::uint32_t PROHIBITED = 10;

    /**
     * @brief Computes the check digit of a payload.
     *
     * @param digits The 8 payload digits, each in [0, 9].
     * @return The check digit in [0, 9], or `std::nullopt` when the payload
     * reduces to the prohibited value 10.
     *
     * @code
     * Checksum::compute({1, 0, 9, 3, 2, 2, 5, 5}); // 1
     * Checksum::compute({0, 0, 0, 0, 0, 2, 0, 0}); // nullopt
     * @endcode
     */
    static std::optional<std::uint8_t> compute(const Digits& digits);

    /**
     * @brief Weighted digit sum before reduction.
     */
    static std::uint32_t weighted_sum(const Digits& digits);

    /// @brief True if the payload has a valid check digit.
    static bool is_issuable(const Digits& digits);
};

} // namespace swissuid::core
