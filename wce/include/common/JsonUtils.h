// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of WCE (Workflow Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/workflow-core-engine/blob/main/LICENSE

#pragma once

#include "WCETypes.h"
#include <optional>
#include <string>

namespace WCE {

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Shared by the parsers, the model serializers and the condition evaluator.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Safely get string value from JSON object
     * @return String value, or defaultValue when missing or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Safely get boolean value from JSON object
     * @return Boolean value, or defaultValue when missing or not a boolean
     */
    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Truthiness of a dynamic value
     *
     * null/missing, false, 0, NaN and "" are falsy; everything else
     * (including empty arrays and objects) is truthy.
     */
    static bool isTruthy(const json &value);

    /**
     * @brief String form used for loose comparisons
     *
     * Strings are returned unquoted, null becomes "", numbers and booleans use
     * their literal form and structured values their compact JSON.
     */
    static std::string stringify(const json &value);

    /**
     * @brief Parse a whole string as a finite number
     * @return Number, or nullopt when the string is empty or not entirely numeric
     */
    static std::optional<double> parseNumber(const std::string &text);

    /**
     * @brief Format a timestamp as ISO-8601 UTC with milliseconds ("2025-01-31T08:15:00.000Z")
     */
    static std::string formatTimestamp(const Timestamp &timestamp);

    /**
     * @brief Parse an ISO-8601 UTC timestamp produced by formatTimestamp
     * @return Timestamp, or nullopt on malformed input
     */
    static std::optional<Timestamp> parseTimestamp(const std::string &text);
};

}  // namespace WCE
