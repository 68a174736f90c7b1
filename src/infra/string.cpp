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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 *
 * @details
 * Bidirectional iterator scanning for `trim`, plain ASCII range checks for
 * the character classes.
 */

#include "swissuid/infra/string.hpp"

#include <algorithm>

namespace swissuid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * Implementation Strategy:
 * 1. **Linear Prefix Scan**: Identifies the first non-whitespace character.
 * 2. **Empty State Detection**: Provides an early exit if the string is
 * composed entirely of whitespace characters.
 * 3. **Linear Suffix Scan**: Identifies the terminal non-whitespace character
 * by scanning backwards from the end of the buffer.
 * 4. **Range Construction**: Substrings the valid range into a new `std::string`.
 *
 * @param s The source string to be sanitized.
 * @return std::string The resulting string after stripping whitespace.
 */
std::string String::trim(const std::string& s)
{
    // 1. Prefix Scan: Locate the first character that is NOT a whitespace.
    auto start = s.begin();
    while (start != s.end() && is_space(*start)) {
        start++;
    }

    // 2. Short-circuit: empty or exclusively whitespace.
    if (start == s.end()) {
        return "";
    }

    // 3. Suffix Scan: Locate the final character that is NOT a whitespace.
    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && is_space(*end));

    // 4. [start, end + 1) keeps the terminal character.
    return std::string(start, end + 1);
}

std::string String::to_upper(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return out;
}

bool String::is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool String::is_alpha(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool String::is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace swissuid::infra
