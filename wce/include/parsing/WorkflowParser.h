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
#include "model/WorkflowDefinition.h"
#include <memory>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Parser for FSM workflow definitions
 *
 * Document form:
 * @code
 * {
 *   "name": "Expense Approval",
 *   "type": "approval",
 *   "version": "1.0.0",
 *   "states": {
 *     "draft":    { "initial": true, "transitions": { "submit": "review" } },
 *     "review":   { "on_enter": ["notifyManager"],
 *                   "transitions": {
 *                     "approve": { "target": "approved", "guards": ["isManager"],
 *                                  "actions": [{ "type": "log", "params": { "msg": "ok" } }] },
 *                     "reject": "rejected" } },
 *     "approved": { "final": true },
 *     "rejected": { "final": true }
 *   }
 * }
 * @endcode
 *
 * A transition value is either a target state name or an object with
 * target, guards and actions. The id defaults to one derived from the name
 * and the version to 1.0.0.
 *
 * Errors are collected rather than thrown: on failure parseContent/parseFile
 * return nullptr and getErrorMessages() describes every problem found.
 */
class WorkflowParser {
public:
    WorkflowParser() = default;
    ~WorkflowParser() = default;

    /**
     * @brief Parse a definition file
     * @param filename File path to parse
     * @param id Explicit definition id (overrides the document)
     * @return Parsed definition, nullptr on failure
     */
    std::shared_ptr<WorkflowDefinition> parseFile(const std::string &filename, const std::string &id = "");

    /**
     * @brief Parse a definition from JSON text
     * @return Parsed definition, nullptr on failure
     */
    std::shared_ptr<WorkflowDefinition> parseContent(const std::string &content, const std::string &id = "");

    /**
     * @brief Parse an already decoded JSON document
     * @return Parsed definition, nullptr on failure
     */
    std::shared_ptr<WorkflowDefinition> parseDocument(const json &document, const std::string &id = "");

    bool hasErrors() const;

    const std::vector<std::string> &getErrorMessages() const;

    const std::vector<std::string> &getWarningMessages() const;

    /**
     * @brief Check the structural invariants of a definition
     *
     * Reports a missing id/name/version, zero states, a missing or unknown
     * initial state, no final state and transitions whose target does not exist.
     *
     * @return One message per violation, empty when valid
     */
    static std::vector<std::string> validateWorkflowDefinition(const WorkflowDefinition &definition);

private:
    void initParsing();
    void addError(const std::string &message);
    void addWarning(const std::string &message);

    bool parseState(const std::string &stateName, const json &stateJson, StateConfig &state);
    bool parseTransition(const std::string &stateName, const std::string &transitionName, const json &value,
                         TransitionConfig &transition);

    std::vector<std::string> errorMessages_;
    std::vector<std::string> warningMessages_;
};

}  // namespace WCE
