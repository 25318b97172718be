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

#include "model/FlowDefinition.h"
#include "model/WorkflowDefinition.h"
#include "model/WorkflowInstance.h"
#include "model/WorkflowTask.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Filter for IWorkflowStorage::queryInstances
 */
struct InstanceQuery {
    enum class SortField {
        CREATED_AT,
        STARTED_AT,
        COMPLETED_AT
    };

    std::optional<std::string> workflowId;
    std::vector<InstanceStatus> statuses;  // Empty matches every status
    std::optional<std::string> startedBy;

    SortField sortBy = SortField::CREATED_AT;
    bool descending = true;
    std::size_t skip = 0;
    std::size_t limit = 50;
};

/**
 * @brief Persistence port for definitions, instances and tasks
 *
 * The engines never talk to storage directly; WorkflowService and
 * ApprovalService read a record, mutate it and write it back through this
 * interface. Implementations store and return copies.
 *
 * Definitions are versioned: getDefinition without a version returns the most
 * recently saved version of that id.
 */
class IWorkflowStorage {
public:
    virtual ~IWorkflowStorage() = default;

    // Definitions
    virtual void saveDefinition(const WorkflowDefinition &definition) = 0;
    virtual std::optional<WorkflowDefinition> getDefinition(const std::string &id,
                                                            const std::optional<std::string> &version) const = 0;

    /**
     * @brief Latest version of every stored definition
     */
    virtual std::vector<WorkflowDefinition> listDefinitions() const = 0;

    virtual void saveFlow(const FlowDefinition &flow) = 0;
    virtual std::optional<FlowDefinition> getFlow(const std::string &id,
                                                  const std::optional<std::string> &version) const = 0;

    // Instances
    virtual void saveInstance(const WorkflowInstance &instance) = 0;
    virtual std::optional<WorkflowInstance> getInstance(const std::string &id) const = 0;

    /**
     * @brief Replace a stored instance
     * @throws WorkflowError INSTANCE_NOT_FOUND if the id was never saved
     */
    virtual void updateInstance(const WorkflowInstance &instance) = 0;

    virtual std::vector<WorkflowInstance> queryInstances(const InstanceQuery &query) const = 0;

    // Tasks
    virtual void saveTask(const WorkflowTask &task) = 0;
    virtual std::optional<WorkflowTask> getTask(const std::string &id) const = 0;

    /**
     * @brief Replace a stored task
     * @throws WorkflowError TASK_NOT_FOUND if the id was never saved
     */
    virtual void updateTask(const WorkflowTask &task) = 0;

    /**
     * @brief Tasks of one instance, in creation order
     */
    virtual std::vector<WorkflowTask> getInstanceTasks(const std::string &instanceId) const = 0;

    /**
     * @brief Every task still pending, across instances
     */
    virtual std::vector<WorkflowTask> getPendingTasks() const = 0;
};

}  // namespace WCE
