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
 * @file error.hpp
 * @brief Typed failure reporting for UID parsing and construction.
 *
 * @details
 * Every rejection in the core is raised as a `UidError`. The exception derives
 * from `std::runtime_error`, so top-level `catch (const std::exception&)`
 * handlers keep working, while callers that care can branch on `kind()`.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace swissuid::core {

/**
 * @enum ErrorKind
 * @brief Classification of a rejected identifier.
 */
enum class ErrorKind {
    INVALID_FORMAT,        ///< No recognized prefix, or not exactly 9 digits in the expected grouping.
    INVALID_CHECK_DIGIT,   ///< The payload checksums to 10; no identifier can carry it.
    MISMATCHED_CHECK_DIGIT ///< The declared 9th digit differs from the computed check digit.
};

/**
 * @brief Stable name of an error kind ("InvalidFormat", ...), used on the wire.
 */
const char* to_string(ErrorKind kind);

/**
 * @class UidError
 * @brief Exception raised by `Uid::parse`, `Uid::from_digits` and `Parser::scan`.
 */
class UidError : public std::runtime_error {
  public:
    /**
     * @brief The input could not be decomposed into prefix and 9 digits.
     *
     * @param detail Human readable reason, naming the offending token.
     */
    static UidError invalid_format(const std::string& detail);

    /**
     * @brief The payload has no valid check digit.
     *
     * @param rendered Debug rendering of the rejected identifier.
     */
    static UidError invalid_check_digit(const std::string& rendered);

    /**
     * @brief The declared check digit is wrong.
     *
     * @param rendered Debug rendering of the rejected identifier.
     * @param computed The check digit the payload requires.
     * @param declared The check digit found in the input.
     */
    static UidError mismatched_check_digit(const std::string& rendered, std::uint8_t computed,
                                           std::uint8_t declared);

    ErrorKind kind() const noexcept { return kind_; }

    /// @brief Computed check digit; meaningful for `MISMATCHED_CHECK_DIGIT` only.
    std::uint8_t computed() const noexcept { return computed_; }

    /// @brief Declared check digit; meaningful for `MISMATCHED_CHECK_DIGIT` only.
    std::uint8_t declared() const noexcept { return declared_; }

  private:
    UidError(ErrorKind kind, const std::string& message, std::uint8_t computed = 0,
             std::uint8_t declared = 0);

    ErrorKind kind_;
    std::uint8_t computed_;
    std::uint8_t declared_;
};

} // namespace swissuid::core
