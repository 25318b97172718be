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

#include "storage/InMemoryWorkflowStorage.h"
#include "common/Logger.h"
#include "common/WorkflowError.h"

#include <algorithm>

namespace WCE {

namespace {

template <typename Definition>
void storeVersion(std::vector<Definition> &versions, const Definition &definition) {
    auto existing = std::find_if(versions.begin(), versions.end(),
                                 [&](const Definition &stored) { return stored.version == definition.version; });
    if (existing != versions.end()) {
        versions.erase(existing);
    }
    versions.push_back(definition);
}

template <typename Definition>
std::optional<Definition> findVersion(const std::vector<Definition> &versions,
                                      const std::optional<std::string> &version) {
    if (versions.empty()) {
        return std::nullopt;
    }
    if (!version) {
        return versions.back();
    }
    for (const auto &stored : versions) {
        if (stored.version == *version) {
            return stored;
        }
    }
    return std::nullopt;
}

Timestamp sortKey(const WorkflowInstance &instance, InstanceQuery::SortField field) {
    switch (field) {
    case InstanceQuery::SortField::STARTED_AT:
        return instance.startedAt.value_or(Timestamp{});
    case InstanceQuery::SortField::COMPLETED_AT:
        return instance.completedAt.value_or(Timestamp{});
    case InstanceQuery::SortField::CREATED_AT:
    default:
        return instance.createdAt;
    }
}

}  // namespace

void InMemoryWorkflowStorage::saveDefinition(const WorkflowDefinition &definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    storeVersion(definitions_[definition.id], definition);
    LOG_DEBUG("Stored definition {} v{}", definition.id, definition.version);
}

std::optional<WorkflowDefinition> InMemoryWorkflowStorage::getDefinition(
    const std::string &id, const std::optional<std::string> &version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = definitions_.find(id);
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    return findVersion(it->second, version);
}

std::vector<WorkflowDefinition> InMemoryWorkflowStorage::listDefinitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowDefinition> result;
    result.reserve(definitions_.size());
    for (const auto &[id, versions] : definitions_) {
        if (!versions.empty()) {
            result.push_back(versions.back());
        }
    }
    return result;
}

void InMemoryWorkflowStorage::saveFlow(const FlowDefinition &flow) {
    std::lock_guard<std::mutex> lock(mutex_);
    storeVersion(flows_[flow.id], flow);
    LOG_DEBUG("Stored flow {} v{}", flow.id, flow.version);
}

std::optional<FlowDefinition> InMemoryWorkflowStorage::getFlow(const std::string &id,
                                                               const std::optional<std::string> &version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = flows_.find(id);
    if (it == flows_.end()) {
        return std::nullopt;
    }
    return findVersion(it->second, version);
}

void InMemoryWorkflowStorage::saveInstance(const WorkflowInstance &instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_[instance.id] = instance;
}

std::optional<WorkflowInstance> InMemoryWorkflowStorage::getInstance(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(id);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryWorkflowStorage::updateInstance(const WorkflowInstance &instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance.id);
    if (it == instances_.end()) {
        throw WorkflowError(ErrorCode::INSTANCE_NOT_FOUND, "Instance not found: " + instance.id);
    }
    it->second = instance;
}

std::vector<WorkflowInstance> InMemoryWorkflowStorage::queryInstances(const InstanceQuery &query) const {
    std::vector<WorkflowInstance> matches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, instance] : instances_) {
            if (query.workflowId && instance.workflowId != *query.workflowId) {
                continue;
            }
            if (!query.statuses.empty() &&
                std::find(query.statuses.begin(), query.statuses.end(), instance.status) == query.statuses.end()) {
                continue;
            }
            if (query.startedBy && instance.startedBy != query.startedBy) {
                continue;
            }
            matches.push_back(instance);
        }
    }

    // Ties are broken by id so results are deterministic across hash orders
    std::sort(matches.begin(), matches.end(), [&](const WorkflowInstance &a, const WorkflowInstance &b) {
        Timestamp keyA = sortKey(a, query.sortBy);
        Timestamp keyB = sortKey(b, query.sortBy);
        if (keyA != keyB) {
            return query.descending ? keyA > keyB : keyA < keyB;
        }
        return a.id < b.id;
    });

    if (query.skip >= matches.size()) {
        return {};
    }
    auto first = matches.begin() + static_cast<std::ptrdiff_t>(query.skip);
    auto last = matches.end();
    if (query.limit < static_cast<std::size_t>(last - first)) {
        last = first + static_cast<std::ptrdiff_t>(query.limit);
    }
    return std::vector<WorkflowInstance>(first, last);
}

void InMemoryWorkflowStorage::saveTask(const WorkflowTask &task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.find(task.id) == tasks_.end()) {
        taskOrder_.push_back(task.id);
    }
    tasks_[task.id] = task;
}

std::optional<WorkflowTask> InMemoryWorkflowStorage::getTask(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryWorkflowStorage::updateTask(const WorkflowTask &task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task.id);
    if (it == tasks_.end()) {
        throw WorkflowError(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task.id);
    }
    it->second = task;
}

std::vector<WorkflowTask> InMemoryWorkflowStorage::getInstanceTasks(const std::string &instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowTask> result;
    for (const auto &id : taskOrder_) {
        const WorkflowTask &task = tasks_.at(id);
        if (task.instanceId == instanceId) {
            result.push_back(task);
        }
    }
    return result;
}

std::vector<WorkflowTask> InMemoryWorkflowStorage::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowTask> result;
    for (const auto &id : taskOrder_) {
        const WorkflowTask &task = tasks_.at(id);
        if (task.isPending()) {
            result.push_back(task);
        }
    }
    return result;
}

void InMemoryWorkflowStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    definitions_.clear();
    flows_.clear();
    instances_.clear();
    tasks_.clear();
    taskOrder_.clear();
}

std::size_t InMemoryWorkflowStorage::getInstanceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

std::size_t InMemoryWorkflowStorage::getTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace WCE
