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
#include <string>
#include <variant>

namespace WCE {

/**
 * @brief Inline guard/action configuration: { "type": "...", "params": {...} }
 *
 * Resolved through the same registry as a named reference, with params passed
 * to the registered function.
 */
struct InlineReference {
    std::string type;
    json params;

    bool operator==(const InlineReference &other) const {
        return type == other.type && params == other.params;
    }
};

/**
 * @brief Reference to a registered guard or action
 *
 * Either a bare registry name or an inline configuration object.
 */
using HookReference = std::variant<std::string, InlineReference>;
using GuardReference = HookReference;
using ActionReference = HookReference;

/**
 * @brief Registry key of a reference (the name, or the inline type)
 */
inline const std::string &referenceName(const HookReference &reference) {
    if (const auto *inlineRef = std::get_if<InlineReference>(&reference)) {
        return inlineRef->type;
    }
    return std::get<std::string>(reference);
}

/**
 * @brief Parameters passed to the resolved function (null for named references)
 */
inline json referenceParams(const HookReference &reference) {
    if (const auto *inlineRef = std::get_if<InlineReference>(&reference)) {
        return inlineRef->params;
    }
    return nullptr;
}

inline bool isInlineReference(const HookReference &reference) {
    return std::holds_alternative<InlineReference>(reference);
}

}  // namespace WCE
