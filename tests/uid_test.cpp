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
 * @file uid_test.cpp
 * @brief Unit tests for UID parsing, validation and rendering.
 *
 * @details
 * Exercises the full `Uid::parse` path (scanner, checksum, codec) against the
 * accepted spellings, every rejection kind, and the three text renderings.
 */

#include "swissuid/core/error.hpp"
#include "swissuid/core/parser.hpp"
#include "swissuid/core/uid.hpp"
#include "framework.hpp"

#include <string>

using swissuid::core::Digits;
using swissuid::core::ErrorKind;
using swissuid::core::Parser;
using swissuid::core::Prefix;
using swissuid::core::Suffix;
using swissuid::core::Uid;
using swissuid::core::UidError;

namespace {

/**
 * @brief Parses `input`, expecting a rejection, and returns the caught error.
 */
UidError expect_rejection(const std::string& input)
{
    try {
        Uid::parse(input);
    } catch (const UidError& e) {
        return e;
    }
    ASSERT_TRUE(false && "parse() accepted invalid input");
    throw swissuid::test::AssertionFailure();
}

} // namespace

/**
 * @brief Canonical input: fields, packed words and every rendering.
 */
void test_uid_parse_canonical()
{
    const Uid uid = Uid::parse("CHE-109.322.551");

    ASSERT_TRUE(uid.prefix() == Prefix::CHE);
    ASSERT_EQ(uid.high_word(), static_cast<std::uint16_t>(0x1093));
    ASSERT_EQ(uid.low_word(), static_cast<std::uint16_t>(0x2255));
    ASSERT_EQ(static_cast<int>(uid.check_digit()), 1);

    ASSERT_EQ(uid.to_string(), std::string("CHE-109.322.551"));
    ASSERT_EQ(uid.to_string(Suffix::HR), std::string("CHE-109.322.551 HR"));
    ASSERT_EQ(uid.to_string(Suffix::MWST), std::string("CHE-109.322.551 MWST"));
    ASSERT_EQ(uid.to_string_hr(), std::string("CHE-109.322.551 HR"));
    ASSERT_EQ(uid.to_string_mwst(), std::string("CHE-109.322.551 MWST"));
    ASSERT_EQ(uid.to_debug_string(), std::string("CHE-109.322.55[1]"));
    ASSERT_EQ(uid.to_string().size(), Uid::PLAIN_LENGTH);
}

/**
 * @brief A trailing register suffix is ignored.
 */
void test_uid_parse_ignores_suffix()
{
    const Uid plain = Uid::parse("CHE-109.322.551");
    ASSERT_EQ(Uid::parse("CHE-109.322.551 MWST"), plain);
    ASSERT_EQ(Uid::parse("CHE-109.322.551 HR"), plain);
    ASSERT_EQ(Uid::parse("CHE-109.322.551, Musterfirma AG"), plain);
}

/**
 * @brief Separators are optional; spaces, dots and hyphens are interchangeable.
 */
void test_uid_parse_separator_variants()
{
    const Uid expected = Uid::parse("CHE-109.322.551");
    ASSERT_EQ(Uid::parse("CHE109322551"), expected);
    ASSERT_EQ(Uid::parse("CHE 109 322 551"), expected);
    ASSERT_EQ(Uid::parse("CHE-109322551"), expected);
    ASSERT_EQ(Uid::parse("CHE.109-322 551"), expected);
    ASSERT_EQ(Uid::parse("  CHE-109.322.551\n"), expected);
}

/**
 * @brief The prefix is matched without regard to case and normalized.
 */
void test_uid_parse_prefix_case()
{
    const Uid uid = Uid::parse("che-109.322.551");
    ASSERT_TRUE(uid.prefix() == Prefix::CHE);
    ASSERT_EQ(uid.to_string(), std::string("CHE-109.322.551"));
    ASSERT_EQ(Uid::parse("Adm-109.322.551").to_string(), std::string("ADM-109.322.551"));
}

void test_uid_parse_adm()
{
    const Uid uid = Uid::parse("ADM-109.322.551");
    ASSERT_TRUE(uid.prefix() == Prefix::ADM);
    ASSERT_EQ(uid.to_string(), std::string("ADM-109.322.551"));
    ASSERT_NE(uid, Uid::parse("CHE-109.322.551"));
}

/**
 * @brief Zeros inside and at the front of the payload are kept.
 */
void test_uid_parse_with_zeroes()
{
    const Uid uid = Uid::parse("CHE-100.002.005");
    ASSERT_EQ(uid.high_word(), static_cast<std::uint16_t>(0x1000));
    ASSERT_EQ(uid.low_word(), static_cast<std::uint16_t>(0x0200));
    ASSERT_EQ(static_cast<int>(uid.check_digit()), 5);
    ASSERT_EQ(uid.to_string(), std::string("CHE-100.002.005"));

    // 000.000.00 -> sum 0 -> check digit 0
    ASSERT_EQ(Uid::parse("CHE-000.000.000").to_string(), std::string("CHE-000.000.000"));
}

void test_uid_rejects_short_prefix()
{
    const UidError e = expect_rejection("CH-109.322.552");
    ASSERT_TRUE(e.kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_EQ(std::string(e.what()), std::string("Invalid format: 'CH' prefix must be 'CHE' or 'ADM'"));
}

void test_uid_rejects_unknown_prefix()
{
    const UidError e = expect_rejection("ABC-109.322.551");
    ASSERT_TRUE(e.kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_EQ(std::string(e.what()),
              std::string("Invalid format: 'ABC' prefix must be 'CHE' or 'ADM'"));

    ASSERT_TRUE(expect_rejection("CHEX-109.322.551").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("XYZ109322551").kind() == ErrorKind::INVALID_FORMAT);
}

void test_uid_rejects_missing_prefix()
{
    ASSERT_TRUE(expect_rejection("109.322.551").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("-CHE-109.322.551").kind() == ErrorKind::INVALID_FORMAT);
}

/**
 * @brief Fewer than 9 digits, broken grouping, or a 10th digit are format errors.
 */
void test_uid_rejects_digit_count()
{
    ASSERT_TRUE(expect_rejection("CHE-109.322.55").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-109.322").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-1093225510").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-109..322.551").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-109.322.55 1").kind() == ErrorKind::INVALID_FORMAT);
}

/**
 * @brief Degenerate input never escapes as anything but a format error.
 */
void test_uid_rejects_degenerate_input()
{
    ASSERT_TRUE(expect_rejection("").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("   ").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("C").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("\xC3\x9C" "BE-109.322.551").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection("CHE-1\xC2\xB9" "9.322.551").kind() == ErrorKind::INVALID_FORMAT);
    ASSERT_TRUE(expect_rejection(std::string("CHE\0-109.322.551", 16)).kind() ==
                ErrorKind::INVALID_FORMAT);
}

/**
 * @brief Payload 000.002.00 checksums to 10; every declared digit is rejected.
 */
void test_uid_rejects_prohibited_payload()
{
    const UidError e = expect_rejection("CHE-000.002.000");
    ASSERT_TRUE(e.kind() == ErrorKind::INVALID_CHECK_DIGIT);
    ASSERT_EQ(std::string(e.what()),
              std::string("Invalid check digit: 'CHE-000.002.00[0]' is prohibited from use"));

    for (char c = '0'; c <= '9'; ++c) {
        const std::string input = std::string("CHE-000.002.00") + c;
        ASSERT_TRUE(expect_rejection(input).kind() == ErrorKind::INVALID_CHECK_DIGIT);
    }
}

void test_uid_rejects_mismatched_check_digit()
{
    const UidError e = expect_rejection("CHE-109.322.552");
    ASSERT_TRUE(e.kind() == ErrorKind::MISMATCHED_CHECK_DIGIT);
    ASSERT_EQ(static_cast<int>(e.computed()), 1);
    ASSERT_EQ(static_cast<int>(e.declared()), 2);
    ASSERT_EQ(std::string(e.what()),
              std::string("Mismatched check digit: 'CHE-109.322.55[2]' should have the check digit [1]"));

    const UidError zeros = expect_rejection("CHE-100.002.000");
    ASSERT_TRUE(zeros.kind() == ErrorKind::MISMATCHED_CHECK_DIGIT);
    ASSERT_EQ(static_cast<int>(zeros.computed()), 5);
}

void test_uid_is_valid()
{
    ASSERT_TRUE(Uid::is_valid("CHE-109.322.551"));
    ASSERT_TRUE(Uid::is_valid("ADM-109.322.551 HR"));
    ASSERT_FALSE(Uid::is_valid("CHE-109.322.552"));
    ASSERT_FALSE(Uid::is_valid("CHE-000.002.000"));
    ASSERT_FALSE(Uid::is_valid(""));
}

/**
 * @brief Rendering then parsing yields an equal value, for every form.
 */
void test_uid_round_trip()
{
    const Uid uid = Uid::parse("che 100 002 005");
    ASSERT_EQ(Uid::parse(uid.to_string()), uid);
    ASSERT_EQ(Uid::parse(uid.to_string_hr()), uid);
    ASSERT_EQ(Uid::parse(uid.to_string_mwst()), uid);

    const Uid copy = uid;
    ASSERT_EQ(copy, uid);
}

/**
 * @brief Construction from a bare payload computes the check digit.
 */
void test_uid_from_digits()
{
    const Uid uid = Uid::from_digits(Prefix::ADM, {1, 0, 9, 3, 2, 2, 5, 5});
    ASSERT_EQ(uid.to_string(), std::string("ADM-109.322.551"));

    const Digits digits = uid.digits();
    ASSERT_EQ(static_cast<int>(digits[2]), 9);
    ASSERT_EQ(static_cast<int>(digits[7]), 5);

    try {
        Uid::from_digits(Prefix::CHE, {0, 0, 0, 0, 0, 2, 0, 0});
        ASSERT_TRUE(false && "prohibited payload accepted");
    } catch (const UidError& e) {
        ASSERT_TRUE(e.kind() == ErrorKind::INVALID_CHECK_DIGIT);
    }

    try {
        Uid::from_digits(Prefix::CHE, {1, 0, 12, 3, 2, 2, 5, 5});
        ASSERT_TRUE(false && "out-of-range digit accepted");
    } catch (const UidError& e) {
        ASSERT_TRUE(e.kind() == ErrorKind::INVALID_FORMAT);
    }
}

/**
 * @brief The scanner alone reports the declared digit without judging it.
 */
void test_parser_scan_fields()
{
    const auto fields = Parser::scan("adm 109.322.552 MWST");
    ASSERT_TRUE(fields.prefix == Prefix::ADM);
    ASSERT_EQ(static_cast<int>(fields.digits[0]), 1);
    ASSERT_EQ(static_cast<int>(fields.digits[7]), 5);
    ASSERT_EQ(static_cast<int>(fields.declared), 2);
}
