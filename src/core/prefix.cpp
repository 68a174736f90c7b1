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
 * @file prefix.cpp
 * @brief Conversions between `Prefix`/`Suffix` and text.
 */

#include "swissuid/core/prefix.hpp"

#include "swissuid/infra/string.hpp"

namespace swissuid::core {

const char* to_string(Prefix prefix)
{
    switch (prefix) {
    case Prefix::CHE:
        return "CHE";
    case Prefix::ADM:
        return "ADM";
    }
    return "???";
}

const char* to_string(Suffix suffix)
{
    switch (suffix) {
    case Suffix::HR:
        return "HR";
    case Suffix::MWST:
        return "MWST";
    }
    return "";
}

bool parse_prefix(const std::string& token, Prefix& out)
{
    const std::string tag = infra::String::to_upper(token);

    if (tag == "CHE") {
        out = Prefix::CHE;
        return true;
    }
    if (tag == "ADM") {
        out = Prefix::ADM;
        return true;
    }
    return false;
}

} // namespace swissuid::core
