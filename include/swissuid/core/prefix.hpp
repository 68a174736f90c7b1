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
 * @file prefix.hpp
 * @brief The two UID category tags and their textual forms.
 */

#pragma once

#include <string>

namespace swissuid::core {

/**
 * @enum Prefix
 * @brief Category tag of a UID. The set is closed.
 */
enum class Prefix {
    CHE, ///< Enterprise registered with the commercial registry.
    ADM  ///< Administrative unit.
};

/**
 * @enum Suffix
 * @brief Register annotation appended by `Uid::to_string(Suffix)`.
 */
enum class Suffix {
    HR,  ///< Handelsregister (commercial register).
    MWST ///< Mehrwertsteuer (VAT register).
};

/// @brief Canonical upper-case tag ("CHE" or "ADM").
const char* to_string(Prefix prefix);

/// @brief Literal suffix text ("HR" or "MWST").
const char* to_string(Suffix suffix);

/**
 * @brief Resolves a three-letter token, ignoring ASCII case.
 *
 * @param token Candidate tag, e.g. "che".
 * @param out Receives the canonical prefix on success.
 * @return true if `token` is one of the two recognized tags.
 */
bool parse_prefix(const std::string& token, Prefix& out);

} // namespace swissuid::core
