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
 * @file handler.hpp
 * @brief JSON command dispatcher over the UID core.
 *
 * @details
 * This header declares the `Handler` class, the protocol adapter between
 * line-oriented JSON requests (stdin of the `swissuid` tool, or any embedding
 * service) and the `core` value type. It deserializes the request, routes on
 * its `action`, and serializes the result or the failure.
 */

#pragma once

#include <string>

namespace swissuid::tool {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 *
 * @details
 * Responsibilities:
 * 1. **Ingest:** Parsing the raw JSON string.
 * 2. **Decode:** Extracting the `action` opcode and its arguments.
 * 3. **Dispatch:** Invoking `core::Uid` / `core::Checksum`.
 * 4. **Emit:** Serializing the result (or the `UidError`) into a JSON response.
 */
class Handler {
  public:
    /// @brief Upper bound for `count` in a `generate` request.
    static constexpr int MAX_GENERATE = 1000;

    /**
     * @brief Processes one raw request and returns one serialized response.
     *
     * **Actions:**
     * - `validate` (`uid`): full breakdown of a valid identifier.
     * - `format` (`uid`, `style` = plain | hr | mwst | debug): one rendering.
     * - `checksum` (`digits`, 8 decimal digits): the check digit.
     * - `generate` (`count`, default 1): random valid identifiers.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "message": "<description>"}`, plus
     *   `"kind"` for identifier failures and `"computed"`/`"declared"` for
     *   check digit mismatches.
     *
     * @param raw_json The raw request payload.
     * @return std::string A compact JSON response. Never throws on bad input.
     *
     * @code
     * // Example Request Payload:
     * { "action": "validate", "uid": "CHE-109.322.551 MWST" }
     * @endcode
     */
    static std::string process(const std::string& raw_json);
};

} // namespace swissuid::tool
