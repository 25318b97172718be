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

#include "approval/ApprovalService.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "common/WorkflowError.h"

#include <algorithm>

namespace WCE {

ApprovalService::ApprovalService(IWorkflowStorage &storage) : storage_(storage) {}

WorkflowTask ApprovalService::createTask(const TaskSpec &spec) {
    WorkflowTask task;
    task.id = UniqueIdGenerator::generateTaskId();
    task.instanceId = spec.instanceId;
    task.name = spec.name;
    task.description = spec.description;
    task.assignedTo = spec.assignedTo;
    task.status = TaskStatus::PENDING;
    task.data = spec.data.is_object() ? spec.data : json::object();
    task.dueDate = spec.dueDate;
    task.autoEscalate = spec.autoEscalate;
    task.escalationTarget = spec.escalationTarget;
    task.createdAt = now();

    storage_.saveTask(task);
    LOG_DEBUG("Created task {} '{}' for instance {} assigned to '{}'", task.id, task.name, task.instanceId,
              task.assignedTo);
    return task;
}

WorkflowTask ApprovalService::getTask(const std::string &taskId) const {
    auto task = storage_.getTask(taskId);
    if (!task) {
        throw WorkflowError(ErrorCode::TASK_NOT_FOUND, "Task not found: " + taskId);
    }
    return *task;
}

WorkflowTask ApprovalService::completeTask(const std::string &taskId, const json &result) {
    return resolve(taskId, TaskStatus::COMPLETED, result);
}

WorkflowTask ApprovalService::rejectTask(const std::string &taskId, const json &result) {
    return resolve(taskId, TaskStatus::REJECTED, result);
}

WorkflowTask ApprovalService::delegateTask(const std::string &taskId, const std::string &delegateTo,
                                           const std::string &delegatedBy, const std::optional<std::string> &reason) {
    WorkflowTask task = requirePendingTask(taskId, "delegate");

    if (!task.originalAssignee) {
        task.originalAssignee = task.assignedTo;
    }
    task.delegatedTo = delegateTo;
    task.delegatedBy = delegatedBy;
    task.delegatedAt = now();
    task.delegationReason = reason;

    storage_.updateTask(task);
    LOG_INFO("Task {} delegated to '{}' by '{}'", task.id, delegateTo, delegatedBy);
    return task;
}

WorkflowTask ApprovalService::escalateTask(const std::string &taskId, const std::string &escalateTo,
                                           const std::optional<std::string> &reason,
                                           const std::optional<std::string> &escalatedBy) {
    WorkflowTask task = requirePendingTask(taskId, "escalate");

    task.escalatedTo = escalateTo;
    task.escalatedBy = escalatedBy;
    task.escalatedAt = now();
    task.escalationReason = reason;

    storage_.updateTask(task);
    LOG_INFO("Task {} escalated to '{}'{}", task.id, escalateTo, reason ? " (" + *reason + ")" : "");
    return task;
}

std::vector<WorkflowTask> ApprovalService::createApprovalChain(const std::string &instanceId,
                                                               const ApprovalChain &chain,
                                                               const std::string &workflowName) {
    std::vector<WorkflowTask> tasks;
    tasks.reserve(chain.levels.size());

    for (const auto &level : chain.levels) {
        TaskSpec spec;
        spec.instanceId = instanceId;
        spec.name = workflowName + "_approval_level_" + std::to_string(level.level);
        spec.description = level.description.empty() ? "Approval required at level " + std::to_string(level.level)
                                                      : level.description;
        spec.assignedTo = level.approver;
        spec.data = json{{"approvalLevel", level.level}, {"required", level.required}};
        spec.autoEscalate = level.escalationTarget.has_value();
        spec.escalationTarget = level.escalationTarget;
        if (level.escalationTimeout) {
            spec.dueDate = now() + *level.escalationTimeout;
        }
        tasks.push_back(createTask(spec));
    }

    LOG_INFO("Created approval chain of {} levels for instance {}", tasks.size(), instanceId);
    return tasks;
}

bool ApprovalService::isApprovalChainComplete(const std::string &instanceId) const {
    auto tasks = storage_.getInstanceTasks(instanceId);
    return std::all_of(tasks.begin(), tasks.end(), [](const WorkflowTask &task) {
        bool required = JsonUtils::getBool(task.data, "required", true);
        return !required || task.status == TaskStatus::COMPLETED;
    });
}

bool ApprovalService::hasRejectedApproval(const std::string &instanceId) const {
    auto tasks = storage_.getInstanceTasks(instanceId);
    return std::any_of(tasks.begin(), tasks.end(),
                       [](const WorkflowTask &task) { return task.status == TaskStatus::REJECTED; });
}

std::vector<WorkflowTask> ApprovalService::getApprovalHistory(const std::string &instanceId) const {
    auto tasks = storage_.getInstanceTasks(instanceId);
    std::stable_sort(tasks.begin(), tasks.end(), [](const WorkflowTask &a, const WorkflowTask &b) {
        if (!a.completedAt || !b.completedAt) {
            return a.completedAt.has_value() && !b.completedAt.has_value();
        }
        return *a.completedAt < *b.completedAt;
    });
    return tasks;
}

std::vector<WorkflowTask> ApprovalService::checkAutoEscalation(Timestamp currentTime) {
    std::vector<WorkflowTask> escalated;

    for (const auto &task : storage_.getPendingTasks()) {
        if (!task.autoEscalate || !task.dueDate || !task.escalationTarget) {
            continue;
        }
        if (currentTime <= *task.dueDate) {
            continue;
        }
        if (task.escalatedTo == task.escalationTarget) {
            continue;
        }

        std::string reason = "Automatic escalation - task overdue since " + JsonUtils::formatTimestamp(*task.dueDate);
        escalated.push_back(escalateTask(task.id, *task.escalationTarget, reason));
    }

    if (!escalated.empty()) {
        LOG_INFO("Auto-escalated {} overdue tasks", escalated.size());
    }
    return escalated;
}

WorkflowTask ApprovalService::requirePendingTask(const std::string &taskId, const char *operation) const {
    WorkflowTask task = getTask(taskId);
    if (task.status != TaskStatus::PENDING) {
        throw WorkflowError(ErrorCode::INVALID_TASK_STATE, std::string("Cannot ") + operation +
                                                               " task in status: " + taskStatusToString(task.status));
    }
    return task;
}

WorkflowTask ApprovalService::resolve(const std::string &taskId, TaskStatus status, const json &result) {
    WorkflowTask task = requirePendingTask(taskId, status == TaskStatus::COMPLETED ? "complete" : "reject");

    task.status = status;
    task.completedAt = now();
    task.result = result;

    storage_.updateTask(task);
    LOG_INFO("Task {} {} by '{}'", task.id, taskStatusToString(status), task.effectiveAssignee());
    return task;
}

}  // namespace WCE
