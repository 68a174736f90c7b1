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
 * @file parser.hpp
 * @brief Tolerant scanner extracting prefix and 9 digits from free text.
 *
 * @details
 * Accepted shape (after trimming surrounding whitespace):
 *
 * @code
 * PFX [sep] DDD [sep] DDD [sep] DD C [free text]
 * @endcode
 *
 * - `PFX` is `CHE` or `ADM`, any ASCII case.
 * - `sep` is a single space, hyphen or dot, and may be absent.
 * - `C` follows the last digit group directly.
 * - Free text after `C` is ignored (" HR", " MWST", ...), unless it starts
 *   with another digit.
 *
 * The scanner only checks structure. It knows nothing about the checksum;
 * `Uid::parse` combines both steps.
 */

#pragma once

#include "swissuid/core/checksum.hpp"
#include "swissuid/core/prefix.hpp"

#include <cstdint>
#include <string>

namespace swissuid::core {

/**
 * @struct Fields
 * @brief Raw components of a scanned identifier, not yet checksum-verified.
 */
struct Fields {
    Prefix prefix = Prefix::CHE;
    Digits digits{};
    std::uint8_t declared = 0; ///< The 9th digit as written in the input.
};

/**
 * @class Parser
 * @brief Static structural scanner for UID text.
 */
class Parser {
  public:
    static constexpr std::size_t PREFIX_LENGTH = 3;

    /**
     * @brief Decomposes `text` into prefix, payload and declared check digit.
     *
     * Runs in a single forward pass bounded by the input length and never
     * reads past the end of `text`.
     *
     * @param text Arbitrary input.
     * @return The scanned fields.
     * @throws UidError with kind `INVALID_FORMAT` on any structural problem.
     */
    static Fields scan(const std::string& text);
};

} // namespace swissuid::core
