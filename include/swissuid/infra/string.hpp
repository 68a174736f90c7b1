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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` holding the small text algorithms used by the identifier
 * scanner, the request dispatcher and the command-line front end.
 */

#pragma once

#include <string>

namespace swissuid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 *
 * @details
 * All character classification is ASCII-only. Bytes outside the ASCII range
 * (e.g. UTF-8 continuation bytes) are never classified as letters, digits or
 * whitespace, so untrusted input cannot change the scanner's behaviour
 * through the active locale.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * **Whitespace Definitions:**
     * - Space (`0x20`)
     * - Horizontal Tab (`\t`)
     * - Newline (`\n`)
     * - Carriage Return (`\r`)
     * - Vertical Tab (`\v`)
     * - Form Feed (`\f`)
     *
     * @param s The source string to process.
     * @return std::string A new string instance containing the trimmed content.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * // Example Usage:
     * std::string raw = "   CHE-109.322.551 MWST   \n";
     * std::string clean = swissuid::infra::String::trim(raw); // "CHE-109.322.551 MWST"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Returns a copy with ASCII letters `a-z` folded to `A-Z`.
     *
     * Non-ASCII bytes are copied unchanged.
     */
    static std::string to_upper(const std::string& s);

    /// @brief True for `0-9`.
    static bool is_digit(char c);

    /// @brief True for `A-Z` and `a-z`.
    static bool is_alpha(char c);

    /// @brief True for the six whitespace characters listed for `trim`.
    static bool is_space(char c);
};

} // namespace swissuid::infra
