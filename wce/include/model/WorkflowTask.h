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

enum class TaskStatus {
    PENDING,
    COMPLETED,
    REJECTED
};

const char *taskStatusToString(TaskStatus status);
std::optional<TaskStatus> taskStatusFromString(const std::string &name);

/**
 * @brief Human work item attached to a workflow instance
 *
 * Delegation and escalation are independent audit trails. Neither one changes
 * assignedTo; the active owner is reported by effectiveAssignee().
 */
struct WorkflowTask {
    std::string id;
    std::string instanceId;
    std::string name;
    std::string description;
    std::string assignedTo;
    TaskStatus status = TaskStatus::PENDING;
    json data = json::object();
    std::optional<Timestamp> dueDate;
    bool autoEscalate = false;
    std::optional<std::string> escalationTarget;
    Timestamp createdAt;
    std::optional<Timestamp> completedAt;
    json result;  // null until completed or rejected

    // Delegation
    std::optional<std::string> originalAssignee;  // Recorded on first delegation only
    std::optional<std::string> delegatedTo;
    std::optional<std::string> delegatedBy;
    std::optional<Timestamp> delegatedAt;
    std::optional<std::string> delegationReason;

    // Escalation
    std::optional<std::string> escalatedTo;
    std::optional<std::string> escalatedBy;
    std::optional<Timestamp> escalatedAt;
    std::optional<std::string> escalationReason;

    /**
     * @brief Active owner: escalatedTo, then delegatedTo, then assignedTo
     */
    const std::string &effectiveAssignee() const;

    bool isPending() const {
        return status == TaskStatus::PENDING;
    }
};

/**
 * @brief Input for ApprovalService::createTask
 */
struct TaskSpec {
    std::string instanceId;
    std::string name;
    std::string description;
    std::string assignedTo;
    json data = json::object();
    std::optional<Timestamp> dueDate;
    bool autoEscalate = false;
    std::optional<std::string> escalationTarget;
};

void to_json(json &j, const WorkflowTask &task);
void from_json(const json &j, WorkflowTask &task);

}  // namespace WCE
