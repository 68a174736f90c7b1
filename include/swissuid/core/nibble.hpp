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
 * @file nibble.hpp
 * @brief Packing of decimal digits into 16-bit words, one digit per nibble.
 *
 * @details
 * A UID payload of 8 digits is stored as two words: digits 0..3 in the high
 * word, digits 4..7 in the low word, most significant nibble first. Since a
 * decimal digit is at most 9, the hexadecimal spelling of a packed word is
 * exactly its four decimal digits (`{1,0,9,3}` <-> `0x1093`).
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace swissuid::core {

/**
 * @class Nibble
 * @brief Static codec between digit arrays and packed words.
 *
 * @details
 * The codec keeps only the low nibble of every input value and performs no
 * range check: values above 9 (e.g. 11) survive a round trip as 0xB but do
 * not denote a decimal digit. Bounds are enforced by the parser before
 * anything is packed.
 */
class Nibble {
  public:
    static constexpr std::size_t PER_WORD = 4;
    static constexpr std::size_t PAYLOAD = 2 * PER_WORD;

    /**
     * @brief Packs four values into one word, first value in the top nibble.
     *
     * @code
     * std::uint16_t w = Nibble::pack({1, 2, 3, 4}); // 0x1234
     * @endcode
     */
    static std::uint16_t pack(const std::array<std::uint8_t, PER_WORD>& digits);

    /**
     * @brief Splits a word into its four nibbles, top nibble first.
     *
     * @code
     * auto d = Nibble::unpack(0x1234); // {1, 2, 3, 4}
     * @endcode
     */
    static std::array<std::uint8_t, PER_WORD> unpack(std::uint16_t word);

    /**
     * @brief Packs an 8-digit payload into its (high, low) word pair.
     */
    static std::pair<std::uint16_t, std::uint16_t>
    pack_digits(const std::array<std::uint8_t, PAYLOAD>& digits);

    /**
     * @brief Inverse of `pack_digits`.
     */
    static std::array<std::uint8_t, PAYLOAD> unpack_digits(std::uint16_t high,
                                                           std::uint16_t low);
};

} // namespace swissuid::core
