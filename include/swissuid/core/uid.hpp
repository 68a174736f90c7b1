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
 * @file uid.hpp
 * @brief The Swiss Business Identification Number value type.
 *
 * @details
 * A `Uid` (Unternehmens-Identifikationsnummer) identifies an enterprise or an
 * administrative unit in Switzerland: a category prefix and 9 digits, the
 * last of which is a check digit over the first 8.
 *
 * Values can only be obtained through `parse`, `from_digits` or `generate`,
 * each of which verifies the check digit once. Afterwards a `Uid` is an
 * immutable, trivially copyable value: two packed payload words, the check
 * digit and the prefix. Nothing is allocated.
 *
 * @code
 * auto uid = swissuid::core::Uid::parse("CHE-109.322.551 MWST");
 * uid.to_string();                    // "CHE-109.322.551"
 * uid.to_string(Suffix::HR);          // "CHE-109.322.551 HR"
 * uid.to_debug_string();              // "CHE-109.322.55[1]"
 * @endcode
 */

#pragma once

#include "swissuid/core/checksum.hpp"
#include "swissuid/core/prefix.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace swissuid::core {

/**
 * @class Uid
 * @brief Immutable, checksum-verified UID.
 */
class Uid {
  public:
    /// @brief Length of the plain rendering, e.g. "CHE-109.322.551".
    static constexpr std::size_t PLAIN_LENGTH = 15;

    /**
     * @brief Parses and validates free-form UID text.
     *
     * Accepts `CHE-109.322.551`, `CHE109322551`, `che 109 322 551`,
     * `ADM-109.322.551 HR`, ... (see `Parser`).
     *
     * @param text The input to parse.
     * @return The validated identifier.
     * @throws UidError `INVALID_FORMAT` for structural problems,
     * `INVALID_CHECK_DIGIT` for prohibited payloads, `MISMATCHED_CHECK_DIGIT`
     * when the 9th digit is wrong.
     */
    static Uid parse(const std::string& text);

    /**
     * @brief Non-throwing validity check.
     *
     * @return true if `parse(text)` would succeed.
     */
    static bool is_valid(const std::string& text);

    /**
     * @brief Builds an identifier from a bare payload, computing its check digit.
     *
     * @throws UidError `INVALID_CHECK_DIGIT` if the payload is prohibited, or
     * `INVALID_FORMAT` if a digit exceeds 9.
     */
    static Uid from_digits(Prefix prefix, const Digits& digits);

    /**
     * @brief Synthesizes a random valid `CHE` identifier.
     *
     * The payload never starts with zero. A prohibited payload is repaired by
     * moving its first digit one step (up from 1, down otherwise), which
     * shifts the weighted sum by 5 modulo 11 and always yields a valid check
     * digit on the second attempt.
     */
    static Uid generate();

    Prefix prefix() const { return prefix_; }

    /// @brief The 8 payload digits, unpacked.
    Digits digits() const;

    std::uint8_t check_digit() const { return check_; }

    /// @brief Packed payload digits 0..3 (e.g. 0x1093).
    std::uint16_t high_word() const { return high_; }

    /// @brief Packed payload digits 4..7 (e.g. 0x2255).
    std::uint16_t low_word() const { return low_; }

    /// @brief Plain form: `CHE-109.322.551`.
    std::string to_string() const;

    /// @brief Plain form followed by one space and the suffix: `CHE-109.322.551 MWST`.
    std::string to_string(Suffix suffix) const;

    std::string to_string_hr() const { return to_string(Suffix::HR); }
    std::string to_string_mwst() const { return to_string(Suffix::MWST); }

    /// @brief Check digit bracketed: `CHE-109.322.55[1]`.
    std::string to_debug_string() const;

    bool operator==(const Uid& other) const;
    bool operator!=(const Uid& other) const { return !(*this == other); }

  private:
    Uid(Prefix prefix, std::uint16_t high, std::uint16_t low, std::uint8_t check);

    /// @brief Renders prefix and grouped payload without the check digit: `CHE-109.322.55`.
    static std::string render_payload(Prefix prefix, std::uint16_t high, std::uint16_t low);

    std::uint16_t high_;
    std::uint16_t low_;
    std::uint8_t check_;
    Prefix prefix_;
};

/// @brief Writes the plain form.
std::ostream& operator<<(std::ostream& os, const Uid& uid);

} // namespace swissuid::core
