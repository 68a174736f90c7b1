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
 * @file parser.cpp
 * @brief Single-pass scanner for UID text.
 *
 * @details
 * The scanner walks the trimmed input once:
 * 1. **Prefix**: the leading run of ASCII letters must be a known tag.
 * 2. **Separator**: one optional space, hyphen or dot.
 * 3. **Payload**: digit groups of 3, 3 and 2, each optionally preceded by
 *    one separator (except the first).
 * 4. **Check digit**: the digit directly after the last group.
 * 5. **Tail**: anything but a further digit is ignored.
 */

#include "swissuid/core/parser.hpp"

#include "swissuid/core/error.hpp"
#include "swissuid/infra/string.hpp"

#include <array>

namespace swissuid::core {

namespace {

using infra::String;

/// Sizes of the dotted payload groups ("109.322.55").
constexpr std::array<std::size_t, 3> GROUPS = {3, 3, 2};

bool is_separator(char c)
{
    return c == ' ' || c == '-' || c == '.';
}

std::string quoted(const std::string& s)
{
    return "'" + s + "'";
}

UidError too_few_digits(const std::string& input)
{
    return UidError::invalid_format(quoted(input) + " UID must have 9 digits");
}

} // namespace

Fields Parser::scan(const std::string& text)
{
    const std::string s = String::trim(text);
    if (s.empty()) {
        throw UidError::invalid_format("empty input, expected a UID like 'CHE-109.322.551'");
    }

    Fields fields;
    std::size_t pos = 0;

    // 1. Prefix
    while (pos < s.size() && String::is_alpha(s[pos])) {
        pos++;
    }
    if (pos == 0) {
        throw UidError::invalid_format(quoted(s) + " has no prefix, expected 'CHE' or 'ADM'");
    }
    const std::string token = s.substr(0, pos);
    if (token.size() != PREFIX_LENGTH || !parse_prefix(token, fields.prefix)) {
        throw UidError::invalid_format(quoted(token) + " prefix must be 'CHE' or 'ADM'");
    }

    // 2. Separator after the prefix
    if (pos < s.size() && is_separator(s[pos])) {
        pos++;
    }

    // 3. Payload groups
    std::size_t n = 0;
    for (std::size_t g = 0; g < GROUPS.size(); ++g) {
        if (g > 0 && pos < s.size() && is_separator(s[pos])) {
            pos++;
        }
        for (std::size_t i = 0; i < GROUPS[g]; ++i) {
            if (pos >= s.size() || !String::is_digit(s[pos])) {
                throw too_few_digits(s);
            }
            fields.digits[n++] = static_cast<std::uint8_t>(s[pos++] - '0');
        }
    }

    // 4. Check digit
    if (pos >= s.size() || !String::is_digit(s[pos])) {
        throw too_few_digits(s);
    }
    fields.declared = static_cast<std::uint8_t>(s[pos++] - '0');

    // 5. Tail
    if (pos < s.size() && String::is_digit(s[pos])) {
        throw UidError::invalid_format(quoted(s) + " has more than 9 digits");
    }

    return fields;
}

} // namespace swissuid::core
