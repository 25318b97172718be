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
#include "model/WorkflowTask.h"
#include "storage/IWorkflowStorage.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief One level of an approval chain
 */
struct ApprovalLevel {
    int level = 1;
    std::string approver;
    std::string description;  // Defaults to "Approval required at level <n>"
    bool required = true;
    std::optional<std::string> escalationTarget;
    std::optional<std::chrono::milliseconds> escalationTimeout;  // dueDate = creation time + timeout
};

struct ApprovalChain {
    std::vector<ApprovalLevel> levels;
};

/**
 * @brief Human task lifecycle: create, delegate, escalate, complete, reject
 *
 * Tasks move pending -> completed | rejected exactly once. Delegation and
 * escalation are allowed any number of times while pending and only add audit
 * fields; see WorkflowTask::effectiveAssignee().
 *
 * The service keeps no clock of its own. checkAutoEscalation is meant to be
 * driven by an external scheduler.
 */
class ApprovalService {
public:
    explicit ApprovalService(IWorkflowStorage &storage);

    /**
     * @brief Create and store a pending task
     */
    WorkflowTask createTask(const TaskSpec &spec);

    /**
     * @brief Fetch a task
     * @throws WorkflowError TASK_NOT_FOUND
     */
    WorkflowTask getTask(const std::string &taskId) const;

    /**
     * @brief Mark a pending task completed and store its result
     * @throws WorkflowError TASK_NOT_FOUND, INVALID_TASK_STATE
     */
    WorkflowTask completeTask(const std::string &taskId, const json &result = nullptr);

    /**
     * @brief Mark a pending task rejected and store its result
     * @throws WorkflowError TASK_NOT_FOUND, INVALID_TASK_STATE
     */
    WorkflowTask rejectTask(const std::string &taskId, const json &result = nullptr);

    /**
     * @brief Delegate a pending task
     *
     * originalAssignee is recorded on the first delegation only; later
     * delegations update delegatedTo, delegatedBy and delegationReason.
     *
     * @throws WorkflowError TASK_NOT_FOUND, INVALID_TASK_STATE
     */
    WorkflowTask delegateTask(const std::string &taskId, const std::string &delegateTo, const std::string &delegatedBy,
                              const std::optional<std::string> &reason = std::nullopt);

    /**
     * @brief Escalate a pending task; delegation fields are left untouched
     * @throws WorkflowError TASK_NOT_FOUND, INVALID_TASK_STATE
     */
    WorkflowTask escalateTask(const std::string &taskId, const std::string &escalateTo,
                              const std::optional<std::string> &reason = std::nullopt,
                              const std::optional<std::string> &escalatedBy = std::nullopt);

    /**
     * @brief Create one pending task per chain level
     *
     * Tasks are named "<workflowName>_approval_level_<n>" and carry
     * {approvalLevel, required} in data.
     */
    std::vector<WorkflowTask> createApprovalChain(const std::string &instanceId, const ApprovalChain &chain,
                                                  const std::string &workflowName);

    /**
     * @brief True when every required task of the instance is completed
     */
    bool isApprovalChainComplete(const std::string &instanceId) const;

    bool hasRejectedApproval(const std::string &instanceId) const;

    /**
     * @brief Tasks of the instance ordered by completion time, open tasks last
     */
    std::vector<WorkflowTask> getApprovalHistory(const std::string &instanceId) const;

    /**
     * @brief Escalate overdue auto-escalating tasks to their escalation target
     * @param currentTime Reference time compared against dueDate
     * @return Tasks escalated by this call
     */
    std::vector<WorkflowTask> checkAutoEscalation(Timestamp currentTime);

private:
    WorkflowTask requirePendingTask(const std::string &taskId, const char *operation) const;
    WorkflowTask resolve(const std::string &taskId, TaskStatus status, const json &result);

    IWorkflowStorage &storage_;
};

}  // namespace WCE
