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
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Business category of a workflow definition
 */
enum class WorkflowType {
    APPROVAL,    // Human approval workflow
    SEQUENTIAL,  // Linear sequence of steps
    PARALLEL,    // Parallel branches (executed by the caller)
    CONDITIONAL  // Conditional branching workflow
};

const char *workflowTypeToString(WorkflowType type);
std::optional<WorkflowType> workflowTypeFromString(const std::string &name);

/**
 * @brief Named transition leaving a state
 */
struct TransitionConfig {
    std::string target;
    std::vector<GuardReference> guards;    // Evaluated in order, logical AND
    std::vector<ActionReference> actions;  // Run between source onExit and target onEnter
    json metadata;
};

/**
 * @brief One state of an FSM workflow
 */
struct StateConfig {
    std::string name;
    bool initial = false;
    bool final = false;
    std::vector<ActionReference> onEnter;
    std::vector<ActionReference> onExit;
    std::map<std::string, TransitionConfig> transitions;  // transition name -> config
    json metadata;

    const TransitionConfig *findTransition(const std::string &transitionName) const {
        auto it = transitions.find(transitionName);
        return it != transitions.end() ? &it->second : nullptr;
    }
};

/**
 * @brief Immutable FSM workflow template
 *
 * Structural invariants (checked by WorkflowParser::validateWorkflowDefinition):
 * the initial state exists, every transition target exists and at least one
 * state is final.
 */
struct WorkflowDefinition {
    std::string id;
    std::string name;
    std::string description;
    WorkflowType type = WorkflowType::SEQUENTIAL;
    std::string version;
    std::map<std::string, StateConfig> states;  // state name -> config
    std::string initialState;
    json metadata;

    const StateConfig *findState(const std::string &stateName) const {
        auto it = states.find(stateName);
        return it != states.end() ? &it->second : nullptr;
    }
};

}  // namespace WCE
