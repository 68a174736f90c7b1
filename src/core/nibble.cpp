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
 * @file nibble.cpp
 * @brief Shift/mask implementation of the digit codec.
 */

#include "swissuid/core/nibble.hpp"

namespace swissuid::core {

std::uint16_t Nibble::pack(const std::array<std::uint8_t, PER_WORD>& digits)
{
    std::uint16_t word = 0;
    for (std::uint8_t d : digits) {
        word = static_cast<std::uint16_t>((word << 4) | (d & 0x0F));
    }
    return word;
}

std::array<std::uint8_t, Nibble::PER_WORD> Nibble::unpack(std::uint16_t word)
{
    return {
        static_cast<std::uint8_t>((word >> 12) & 0x0F),
        static_cast<std::uint8_t>((word >> 8) & 0x0F),
        static_cast<std::uint8_t>((word >> 4) & 0x0F),
        static_cast<std::uint8_t>(word & 0x0F),
    };
}

std::pair<std::uint16_t, std::uint16_t>
Nibble::pack_digits(const std::array<std::uint8_t, PAYLOAD>& digits)
{
    const std::array<std::uint8_t, PER_WORD> high = {digits[0], digits[1], digits[2], digits[3]};
    const std::array<std::uint8_t, PER_WORD> low = {digits[4], digits[5], digits[6], digits[7]};
    return {pack(high), pack(low)};
}

std::array<std::uint8_t, Nibble::PAYLOAD> Nibble::unpack_digits(std::uint16_t high,
                                                                std::uint16_t low)
{
    const auto h = unpack(high);
    const auto l = unpack(low);
    return {h[0], h[1], h[2], h[3], l[0], l[1], l[2], l[3]};
}

} // namespace swissuid::core
