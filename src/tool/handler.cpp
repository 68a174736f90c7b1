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
 * @file handler.cpp
 * @brief Implementation of the JSON command processing pipeline.
 *
 * @details
 * Request lifecycle:
 * 1. **Ingest**: Parsing raw JSON.
 * 2. **Execute**: Routing the action to the UID core.
 * 3. **Respond**: Formatting results or `UidError`s into standardized JSON.
 */

#include "swissuid/tool/handler.hpp"

#include "swissuid/core/checksum.hpp"
#include "swissuid/core/error.hpp"
#include "swissuid/core/uid.hpp"
#include "swissuid/infra/logger.hpp"
#include "swissuid/infra/string.hpp"

#include <cJSON.h>

namespace swissuid::tool {

namespace {

using infra::Logger;
using infra::LogLevel;

/**
 * @brief Returns the string member `key` of `obj`, or "" if absent or not a string.
 */
std::string string_arg(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    return (cJSON_IsString(item) && item->valuestring) ? item->valuestring : "";
}

/**
 * @brief Builds the `validate` breakdown of an identifier.
 */
cJSON* describe(const core::Uid& uid)
{
    std::string digits;
    for (std::uint8_t d : uid.digits()) {
        digits += static_cast<char>('0' + d);
    }

    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "prefix", core::to_string(uid.prefix()));
    cJSON_AddStringToObject(obj, "digits", digits.c_str());
    cJSON_AddNumberToObject(obj, "check_digit", uid.check_digit());
    cJSON_AddStringToObject(obj, "plain", uid.to_string().c_str());
    cJSON_AddStringToObject(obj, "hr", uid.to_string_hr().c_str());
    cJSON_AddStringToObject(obj, "mwst", uid.to_string_mwst().c_str());
    cJSON_AddStringToObject(obj, "debug", uid.to_debug_string().c_str());
    return obj;
}

} // namespace

std::string Handler::process(const std::string& raw_json)
{
    // [Safety Check] Short-circuit empty payloads.
    if (infra::String::trim(raw_json).empty()) {
        return "{\"status\":\"error\",\"message\":\"Empty request payload\"}";
    }

    // 1. INGEST PHASE
    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!req) {
        Logger::log(LogLevel::WARN, "Handler: Rejected request with invalid JSON syntax");
        return "{\"status\":\"error\",\"message\":\"Invalid JSON syntax\"}";
    }
    if (!cJSON_IsObject(req)) {
        cJSON_Delete(req);
        Logger::log(LogLevel::WARN, "Handler: Rejected request that is not a JSON object");
        return "{\"status\":\"error\",\"message\":\"Request must be a JSON object\"}";
    }

    const std::string action = string_arg(req, "action");

    cJSON* resp_root = cJSON_CreateObject();
    bool success = false;
    std::string msg = "";

    // 2. COMMAND DISPATCH PHASE
    try {
        if (action == "validate") {
            cJSON* uid_arg = cJSON_GetObjectItemCaseSensitive(req, "uid");
            if (cJSON_IsString(uid_arg) && uid_arg->valuestring) {
                const core::Uid uid = core::Uid::parse(uid_arg->valuestring);
                cJSON_AddItemToObject(resp_root, "data", describe(uid));
                success = true;
            } else {
                msg = "Missing argument: 'uid'";
            }
        } else if (action == "format") {
            cJSON* uid_arg = cJSON_GetObjectItemCaseSensitive(req, "uid");
            std::string style = string_arg(req, "style");
            if (style.empty()) {
                style = "plain";
            }

            if (!cJSON_IsString(uid_arg) || !uid_arg->valuestring) {
                msg = "Missing argument: 'uid'";
            } else if (style != "plain" && style != "hr" && style != "mwst" && style != "debug") {
                msg = "Unknown style: " + style;
            } else {
                const core::Uid uid = core::Uid::parse(uid_arg->valuestring);
                std::string text;
                if (style == "hr") {
                    text = uid.to_string(core::Suffix::HR);
                } else if (style == "mwst") {
                    text = uid.to_string(core::Suffix::MWST);
                } else if (style == "debug") {
                    text = uid.to_debug_string();
                } else {
                    text = uid.to_string();
                }
                cJSON_AddStringToObject(resp_root, "data", text.c_str());
                success = true;
            }
        } else if (action == "checksum") {
            const std::string text = string_arg(req, "digits");
            core::Digits digits{};
            bool well_formed = text.size() == digits.size();
            for (std::size_t i = 0; well_formed && i < digits.size(); ++i) {
                well_formed = infra::String::is_digit(text[i]);
                if (well_formed) {
                    digits[i] = static_cast<std::uint8_t>(text[i] - '0');
                }
            }

            if (!well_formed) {
                msg = "Argument 'digits' must be exactly 8 decimal digits";
            } else {
                const auto check = core::Checksum::compute(digits);
                if (!check) {
                    throw core::UidError::invalid_check_digit(text);
                }
                cJSON_AddNumberToObject(resp_root, "data", *check);
                success = true;
            }
        } else if (action == "generate") {
            cJSON* count_arg = cJSON_GetObjectItemCaseSensitive(req, "count");
            int count = 1;
            if (count_arg) {
                count = cJSON_IsNumber(count_arg) ? count_arg->valueint : 0;
            }

            if (count < 1 || count > MAX_GENERATE) {
                msg = "Argument 'count' must be between 1 and " + std::to_string(MAX_GENERATE);
            } else {
                cJSON* list = cJSON_CreateArray();
                for (int i = 0; i < count; ++i) {
                    const std::string uid = core::Uid::generate().to_string();
                    cJSON_AddItemToArray(list, cJSON_CreateString(uid.c_str()));
                }
                // Ownership Transfer: 'list' becomes child of 'resp_root'
                cJSON_AddItemToObject(resp_root, "data", list);
                success = true;
            }
        } else if (action.empty()) {
            msg = "Missing argument: 'action'";
        } else {
            msg = "Unknown action opcode: " + action;
        }
    } catch (const core::UidError& e) {
        cJSON_AddStringToObject(resp_root, "kind", core::to_string(e.kind()));
        if (e.kind() == core::ErrorKind::MISMATCHED_CHECK_DIGIT) {
            cJSON_AddNumberToObject(resp_root, "computed", e.computed());
            cJSON_AddNumberToObject(resp_root, "declared", e.declared());
        }
        msg = e.what();
    }

    if (!success) {
        Logger::log(LogLevel::DEBUG, "Handler: '" + action + "' rejected: " + msg);
    }

    // 3. RESPONSE CONSTRUCTION PHASE
    cJSON_AddStringToObject(resp_root, "status", success ? "ok" : "error");
    if (!msg.empty()) {
        cJSON_AddStringToObject(resp_root, "message", msg.c_str());
    }

    char* raw_output = cJSON_PrintUnformatted(resp_root);
    std::string final_response = raw_output ? std::string(raw_output) : std::string();

    // Memory Cleanup
    cJSON_free(raw_output);
    cJSON_Delete(resp_root);
    cJSON_Delete(req);

    return final_response;
}

} // namespace swissuid::tool
