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
 * @brief Evaluator for flow edge conditions
 *
 * Grammar (whitespace around operators is optional):
 *   field                      truthiness of the variable
 *   field OP literal           OP is one of == != > >= < <=
 *
 * field is a variable name, optionally a dotted path into nested objects
 * ("order.total"). literal is true/false, a number, a quoted string
 * ('x' or "x") or a bare word. Quoted literals always compare as strings.
 * Relational operators require both sides to be numeric.
 *
 * Malformed expressions evaluate to false and never throw.
 */
class ConditionEvaluator {
public:
    enum class Operator {
        TRUTHY,
        EQUAL,
        NOT_EQUAL,
        GREATER,
        GREATER_EQUAL,
        LESS,
        LESS_EQUAL
    };

    struct Condition {
        std::string field;
        Operator op = Operator::TRUTHY;
        std::string literal;
        bool quoted = false;
    };

    /**
     * @brief Evaluate a condition against a variable map
     * @param expression Condition text
     * @param variables JSON object holding the flow variables
     * @return Result of the comparison, false for malformed expressions
     */
    static bool evaluate(const std::string &expression, const json &variables);

    /**
     * @brief Parse a condition without evaluating it
     * @return Parsed condition, or nullopt when the expression is malformed
     */
    static std::optional<Condition> parse(const std::string &expression);

    /**
     * @brief Evaluate an already parsed condition
     */
    static bool evaluate(const Condition &condition, const json &variables);

private:
    static json lookup(const std::string &field, const json &variables);
    static bool literalEquals(const Condition &condition, const json &actual);
    static std::optional<double> numericValue(const json &value);
};

}  // namespace WCE
