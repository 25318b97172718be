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
#include "model/HookReference.h"
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Helpers shared by WorkflowParser and FlowParser
 */
class ParsingCommon {
public:
    /**
     * @brief Derive a definition id from its name
     *
     * Lowercases, collapses every run of non-alphanumerics to '_' and trims
     * leading/trailing underscores ("Expense Approval v2" -> "expense_approval_v2").
     */
    static std::string generateIdFromName(const std::string &name);

    /**
     * @brief Parse a guard/action reference: "name" or {"type": "...", "params": {...}}
     * @param value JSON value
     * @param errorOut Receives a description when the value is malformed
     * @return Reference, or nullopt when malformed
     */
    static std::optional<HookReference> parseReference(const json &value, std::string *errorOut);

    /**
     * @brief Parse a reference list; a single string or object is accepted as a one-element list
     * @param value JSON value (null yields an empty list)
     * @param context Location used in error messages
     * @param errors Receives one message per malformed entry
     */
    static std::vector<HookReference> parseReferenceList(const json &value, const std::string &context,
                                                         std::vector<std::string> &errors);

    /**
     * @brief Read the file into a string
     * @return Content, or nullopt if the file cannot be opened
     */
    static std::optional<std::string> readFile(const std::string &filename);

    /**
     * @brief Version field as a string; numbers are accepted ("2" for 2)
     */
    static std::string readVersion(const json &document, const std::string &fallback);
};

}  // namespace WCE
