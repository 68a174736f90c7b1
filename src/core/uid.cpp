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
 * @file uid.cpp
 * @brief Validation gate and renderers of the `Uid` value type.
 *
 * @details
 * Control flow of `parse`:
 * text -> `Parser::scan` -> (prefix, payload, declared digit)
 *      -> `Nibble::pack_digits` + `Checksum::compute` -> compare -> `Uid`.
 */

#include "swissuid/core/uid.hpp"

#include "swissuid/core/error.hpp"
#include "swissuid/core/nibble.hpp"
#include "swissuid/core/parser.hpp"
#include "swissuid/infra/id_generator.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace swissuid::core {

Uid::Uid(Prefix prefix, std::uint16_t high, std::uint16_t low, std::uint8_t check)
    : high_(high), low_(low), check_(check), prefix_(prefix)
{
}

Uid Uid::parse(const std::string& text)
{
    const Fields fields = Parser::scan(text);
    const auto words = Nibble::pack_digits(fields.digits);

    const auto computed = Checksum::compute(fields.digits);
    if (!computed || *computed != fields.declared) {
        const std::string rendered = render_payload(fields.prefix, words.first, words.second) +
                                     "[" + std::to_string(fields.declared) + "]";
        if (!computed) {
            throw UidError::invalid_check_digit(rendered);
        }
        throw UidError::mismatched_check_digit(rendered, *computed, fields.declared);
    }

    return Uid(fields.prefix, words.first, words.second, fields.declared);
}

bool Uid::is_valid(const std::string& text)
{
    try {
        parse(text);
        return true;
    } catch (const UidError&) {
        return false;
    }
}

Uid Uid::from_digits(Prefix prefix, const Digits& digits)
{
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] > 9) {
            throw UidError::invalid_format("payload digit " + std::to_string(i) + " is " +
                                           std::to_string(digits[i]) + ", expected 0-9");
        }
    }

    const auto words = Nibble::pack_digits(digits);
    const auto computed = Checksum::compute(digits);
    if (!computed) {
        throw UidError::invalid_check_digit(render_payload(prefix, words.first, words.second));
    }
    return Uid(prefix, words.first, words.second, *computed);
}

Uid Uid::generate()
{
    Digits digits = infra::IdGenerator::payload();

    if (!Checksum::is_issuable(digits)) {
        // Keeps the first digit within [1, 9].
        if (digits[0] <= 1) {
            digits[0]++;
        } else {
            digits[0]--;
        }
    }
    return from_digits(Prefix::CHE, digits);
}

Digits Uid::digits() const
{
    return Nibble::unpack_digits(high_, low_);
}

std::string Uid::render_payload(Prefix prefix, std::uint16_t high, std::uint16_t low)
{
    // Each nibble holds one decimal digit, so hex output spells the digits.
    std::stringstream ss;
    ss << core::to_string(prefix) << "-" << std::hex << std::setfill('0')

       // Digits 0..2
       << std::setw(3) << (high >> 4) << "."

       // Digits 3..5 (last nibble of the high word, top byte of the low word)
       << std::setw(1) << (high & 0x000F) << std::setw(2) << (low >> 8) << "."

       // Digits 6..7
       << std::setw(2) << (low & 0x00FF);

    return ss.str();
}

std::string Uid::to_string() const
{
    return render_payload(prefix_, high_, low_) + std::to_string(check_);
}

std::string Uid::to_string(Suffix suffix) const
{
    return to_string() + " " + core::to_string(suffix);
}

std::string Uid::to_debug_string() const
{
    return render_payload(prefix_, high_, low_) + "[" + std::to_string(check_) + "]";
}

bool Uid::operator==(const Uid& other) const
{
    return prefix_ == other.prefix_ && high_ == other.high_ && low_ == other.low_ &&
           check_ == other.check_;
}

std::ostream& operator<<(std::ostream& os, const Uid& uid)
{
    return os << uid.to_string();
}

} // namespace swissuid::core
