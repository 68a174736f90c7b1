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
 * @file checksum.cpp
 * @brief Implementation of the weighted modulo 11 check digit.
 */

#include "swissuid/core/checksum.hpp"

namespace swissuid::core {

std::uint32_t Checksum::weighted_sum(const Digits& digits)
{
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        sum += static_cast<std::uint32_t>(WEIGHTS[i]) * digits[i];
    }
    return sum;
}

std::optional<std::uint8_t> Checksum::compute(const Digits& digits)
{
    const std::uint32_t result = 11 - (weighted_sum(digits) % 11);

    if (result == 11) {
        return static_cast<std::uint8_t>(0);
    }
    if (result == PROHIBITED) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(result);
}

bool Checksum::is_issuable(const Digits& digits)
{
    return compute(digits).has_value();
}

} // namespace swissuid::core
