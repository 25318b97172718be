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

#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <format>

namespace WCE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_boolean()) {
        return defaultValue;
    }

    return value.get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

bool JsonUtils::isTruthy(const json &value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        double number = value.get<double>();
        return number != 0.0 && !std::isnan(number);
    }
    if (value.is_string()) {
        return !value.get<std::string>().empty();
    }
    return true;
}

std::string JsonUtils::stringify(const json &value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_float()) {
        double number = value.get<double>();
        // Integral doubles print without a fractional part ("1500", not "1500.0")
        if (std::isfinite(number) && number == std::floor(number) && std::fabs(number) < 1e15) {
            return std::to_string(static_cast<long long>(number));
        }
    }
    return value.dump();
}

std::optional<double> JsonUtils::parseNumber(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double number = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(number)) {
            return std::nullopt;
        }
        return number;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::string JsonUtils::formatTimestamp(const Timestamp &timestamp) {
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                       tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(millis));
}

std::optional<Timestamp> JsonUtils::parseTimestamp(const std::string &text) {
    std::tm tm_buf{};
    int millis = 0;
    int consumed = 0;

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm_buf.tm_year, &tm_buf.tm_mon,
                             &tm_buf.tm_mday, &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed);
    if (fields != 6) {
        return std::nullopt;
    }

    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest[0] == '.') {
        int fractionDigits = 0;
        size_t pos = 1;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (fractionDigits < 3) {
                millis = millis * 10 + (rest[pos] - '0');
                fractionDigits++;
            }
            pos++;
        }
        while (fractionDigits > 0 && fractionDigits < 3) {
            millis *= 10;
            fractionDigits++;
        }
        rest = rest.substr(pos);
    }
    if (rest != "Z" && !rest.empty()) {
        return std::nullopt;
    }

    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t seconds = timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

}  // namespace WCE
