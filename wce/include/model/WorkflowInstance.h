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
#include <vector>

namespace WCE {

/**
 * @brief Instance lifecycle status
 *
 * Moves only along PENDING -> RUNNING -> {COMPLETED | ABORTED | FAILED}.
 */
enum class InstanceStatus {
    PENDING,    // Created, not started
    RUNNING,    // Started, accepting transitions
    COMPLETED,  // Terminal state/node reached
    ABORTED,    // Aborted by abortInstance
    FAILED      // Handler failure or traversal limit
};

const char *instanceStatusToString(InstanceStatus status);
std::optional<InstanceStatus> instanceStatusFromString(const std::string &name);

/**
 * @brief True for COMPLETED, ABORTED and FAILED
 */
bool isTerminalStatus(InstanceStatus status);

/**
 * @brief Immutable record of one state/node hop
 */
struct StateHistoryEntry {
    std::string fromState;
    std::string toState;
    std::string transition;  // Transition name, or a label synthesized by the flow engine
    Timestamp timestamp;
    std::optional<std::string> triggeredBy;
    json data;  // Caller payload attached to this hop (null when absent)
};

/**
 * @brief One execution of a workflow or flow definition
 *
 * data is the process working memory; guards and actions reach it only through
 * a DataAccessor. history is append-only.
 */
struct WorkflowInstance {
    std::string id;
    std::string workflowId;
    std::string version;
    std::string currentState;  // State name (FSM) or node id (flow)
    InstanceStatus status = InstanceStatus::PENDING;
    json data = json::object();
    std::vector<StateHistoryEntry> history;

    Timestamp createdAt;
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> completedAt;
    std::optional<Timestamp> abortedAt;
    std::optional<Timestamp> failedAt;

    std::optional<std::string> startedBy;
    std::optional<std::string> completedBy;  // Also records who aborted
    std::optional<std::string> error;

    bool isTerminal() const {
        return isTerminalStatus(status);
    }
};

void to_json(json &j, const StateHistoryEntry &entry);
void from_json(const json &j, StateHistoryEntry &entry);
void to_json(json &j, const WorkflowInstance &instance);
void from_json(const json &j, WorkflowInstance &instance);

}  // namespace WCE
