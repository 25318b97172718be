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

#include "storage/IWorkflowStorage.h"
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace WCE {

/**
 * @brief Thread-safe in-memory IWorkflowStorage
 *
 * Used by tests, examples and the wce_run tool. Every call copies records in
 * and out, so callers never share mutable state with the store.
 */
class InMemoryWorkflowStorage : public IWorkflowStorage {
public:
    InMemoryWorkflowStorage() = default;
    ~InMemoryWorkflowStorage() override = default;

    void saveDefinition(const WorkflowDefinition &definition) override;
    std::optional<WorkflowDefinition> getDefinition(const std::string &id,
                                                    const std::optional<std::string> &version) const override;
    std::vector<WorkflowDefinition> listDefinitions() const override;

    void saveFlow(const FlowDefinition &flow) override;
    std::optional<FlowDefinition> getFlow(const std::string &id,
                                          const std::optional<std::string> &version) const override;

    void saveInstance(const WorkflowInstance &instance) override;
    std::optional<WorkflowInstance> getInstance(const std::string &id) const override;
    void updateInstance(const WorkflowInstance &instance) override;
    std::vector<WorkflowInstance> queryInstances(const InstanceQuery &query) const override;

    void saveTask(const WorkflowTask &task) override;
    std::optional<WorkflowTask> getTask(const std::string &id) const override;
    void updateTask(const WorkflowTask &task) override;
    std::vector<WorkflowTask> getInstanceTasks(const std::string &instanceId) const override;
    std::vector<WorkflowTask> getPendingTasks() const override;

    /**
     * @brief Drop every stored record
     */
    void clear();

    std::size_t getInstanceCount() const;
    std::size_t getTaskCount() const;

private:
    // id -> versions in save order; saving an existing version replaces it in place
    std::map<std::string, std::vector<WorkflowDefinition>> definitions_;
    std::map<std::string, std::vector<FlowDefinition>> flows_;

    std::unordered_map<std::string, WorkflowInstance> instances_;
    std::unordered_map<std::string, WorkflowTask> tasks_;
    std::vector<std::string> taskOrder_;

    mutable std::mutex mutex_;
};

}  // namespace WCE
