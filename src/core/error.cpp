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
 * @file error.cpp
 * @brief Message formatting for `UidError`.
 */

#include "swissuid/core/error.hpp"

namespace swissuid::core {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::INVALID_FORMAT:
        return "InvalidFormat";
    case ErrorKind::INVALID_CHECK_DIGIT:
        return "InvalidCheckDigit";
    case ErrorKind::MISMATCHED_CHECK_DIGIT:
        return "MismatchedCheckDigit";
    }
    return "Unknown";
}

UidError::UidError(ErrorKind kind, const std::string& message, std::uint8_t computed,
                   std::uint8_t declared)
    : std::runtime_error(message), kind_(kind), computed_(computed), declared_(declared)
{
}

UidError UidError::invalid_format(const std::string& detail)
{
    return UidError(ErrorKind::INVALID_FORMAT, "Invalid format: " + detail);
}

UidError UidError::invalid_check_digit(const std::string& rendered)
{
    return UidError(ErrorKind::INVALID_CHECK_DIGIT,
                    "Invalid check digit: '" + rendered + "' is prohibited from use");
}

UidError UidError::mismatched_check_digit(const std::string& rendered, std::uint8_t computed,
                                          std::uint8_t declared)
{
    return UidError(ErrorKind::MISMATCHED_CHECK_DIGIT,
                    "Mismatched check digit: '" + rendered + "' should have the check digit [" +
                        std::to_string(computed) + "]",
                    computed, declared);
}

} // namespace swissuid::core
