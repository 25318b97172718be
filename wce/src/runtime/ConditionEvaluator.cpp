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

#include "runtime/ConditionEvaluator.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <regex>

namespace WCE {

namespace {

// Operators are matched longest first so ">=" is not read as ">" followed by "=..."
const std::regex &comparisonPattern() {
    static const std::regex pattern(R"(^\s*([A-Za-z0-9_]+(?:\.[A-Za-z0-9_]+)*)\s*(==|!=|>=|<=|>|<)\s*(.*?)\s*$)");
    return pattern;
}

const std::regex &fieldPattern() {
    static const std::regex pattern(R"(^\s*([A-Za-z0-9_]+(?:\.[A-Za-z0-9_]+)*)\s*$)");
    return pattern;
}

ConditionEvaluator::Operator operatorFromString(const std::string &text) {
    if (text == "==") {
        return ConditionEvaluator::Operator::EQUAL;
    } else if (text == "!=") {
        return ConditionEvaluator::Operator::NOT_EQUAL;
    } else if (text == ">=") {
        return ConditionEvaluator::Operator::GREATER_EQUAL;
    } else if (text == "<=") {
        return ConditionEvaluator::Operator::LESS_EQUAL;
    } else if (text == ">") {
        return ConditionEvaluator::Operator::GREATER;
    }
    return ConditionEvaluator::Operator::LESS;
}

bool isQuote(char c) {
    return c == '"' || c == '\'';
}

}  // namespace

std::optional<ConditionEvaluator::Condition> ConditionEvaluator::parse(const std::string &expression) {
    std::smatch match;

    if (std::regex_match(expression, match, fieldPattern())) {
        Condition condition;
        condition.field = match[1].str();
        return condition;
    }

    if (!std::regex_match(expression, match, comparisonPattern())) {
        return std::nullopt;
    }

    Condition condition;
    condition.field = match[1].str();
    condition.op = operatorFromString(match[2].str());

    std::string literal = match[3].str();
    if (literal.size() >= 2 && isQuote(literal.front()) && literal.back() == literal.front()) {
        condition.literal = literal.substr(1, literal.size() - 2);
        condition.quoted = true;
    } else {
        if (literal.empty() || literal.find_first_of("\"'") != std::string::npos) {
            return std::nullopt;
        }
        condition.literal = literal;
    }

    if (condition.op != Operator::EQUAL && condition.op != Operator::NOT_EQUAL) {
        // Relational comparisons are numeric only
        if (condition.quoted || !JsonUtils::parseNumber(condition.literal)) {
            return std::nullopt;
        }
    }

    return condition;
}

bool ConditionEvaluator::evaluate(const std::string &expression, const json &variables) {
    auto condition = parse(expression);
    if (!condition) {
        LOG_DEBUG("malformed condition '{}' evaluates to false", expression);
        return false;
    }
    return evaluate(*condition, variables);
}

bool ConditionEvaluator::evaluate(const Condition &condition, const json &variables) {
    json actual = lookup(condition.field, variables);

    switch (condition.op) {
    case Operator::TRUTHY:
        return JsonUtils::isTruthy(actual);
    case Operator::EQUAL:
        return literalEquals(condition, actual);
    case Operator::NOT_EQUAL:
        return !literalEquals(condition, actual);
    default:
        break;
    }

    auto left = numericValue(actual);
    auto right = JsonUtils::parseNumber(condition.literal);
    if (!left || !right) {
        return false;
    }

    switch (condition.op) {
    case Operator::GREATER:
        return *left > *right;
    case Operator::GREATER_EQUAL:
        return *left >= *right;
    case Operator::LESS:
        return *left < *right;
    case Operator::LESS_EQUAL:
        return *left <= *right;
    default:
        return false;
    }
}

json ConditionEvaluator::lookup(const std::string &field, const json &variables) {
    const json *current = &variables;
    std::size_t start = 0;
    while (start <= field.size()) {
        std::size_t dot = field.find('.', start);
        std::string segment = field.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return *current;
}

bool ConditionEvaluator::literalEquals(const Condition &condition, const json &actual) {
    if (condition.quoted) {
        return JsonUtils::stringify(actual) == condition.literal;
    }

    if (condition.literal == "true") {
        return (actual.is_boolean() && actual.get<bool>()) || (actual.is_string() && actual.get<std::string>() == "true");
    }
    if (condition.literal == "false") {
        return (actual.is_boolean() && !actual.get<bool>()) ||
               (actual.is_string() && actual.get<std::string>() == "false");
    }

    if (auto expected = JsonUtils::parseNumber(condition.literal)) {
        auto value = numericValue(actual);
        return value && *value == *expected;
    }

    return JsonUtils::stringify(actual) == condition.literal;
}

std::optional<double> ConditionEvaluator::numericValue(const json &value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return JsonUtils::parseNumber(value.get<std::string>());
    }
    return std::nullopt;
}

}  // namespace WCE
