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
#include "approval/ApprovalService.h"
#include "runtime/EngineConfig.h"
#include "runtime/FlowEngine.h"
#include "runtime/WorkflowEngine.h"
#include "storage/IWorkflowStorage.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Instance and result of WorkflowService::runFlow
 */
struct FlowRun {
    WorkflowInstance instance;
    FlowExecutionResult result;
};

/**
 * @brief Storage-backed facade over the FSM engine, the flow engine and the
 * approval service
 *
 * Every operation reads the instance from storage, runs the engine and writes
 * the instance back. When an action throws, the partially mutated instance is
 * persisted before the exception is rethrown, so a re-fetch shows the real
 * post-failure state.
 *
 * Guards, actions and handlers are registered on the engines returned by
 * getEngine() and getFlowEngine().
 */
class WorkflowService {
public:
    explicit WorkflowService(std::shared_ptr<IWorkflowStorage> storage, const EngineConfig &config = EngineConfig{});

    WorkflowService(const WorkflowService &) = delete;
    WorkflowService &operator=(const WorkflowService &) = delete;

    WorkflowEngine &getEngine() {
        return engine_;
    }

    FlowEngine &getFlowEngine() {
        return flowEngine_;
    }

    ApprovalService &getApprovalService() {
        return approvals_;
    }

    IWorkflowStorage &getStorage() {
        return *storage_;
    }

    /**
     * @brief Validate and store an FSM definition
     *
     * Guard/action names without a registered function are logged as warnings.
     *
     * @throws WorkflowError VALIDATION_ERROR listing every structural problem
     */
    void registerWorkflow(const WorkflowDefinition &definition);

    /**
     * @brief Validate and store a flow definition
     *
     * Missing name, no nodes and edges to unknown nodes are fatal; the other
     * FlowParser::validateFlow findings and unhandled node types are warnings.
     *
     * @throws WorkflowError VALIDATION_ERROR
     */
    void registerFlow(const FlowDefinition &flow);

    /**
     * @throws WorkflowError DEFINITION_NOT_FOUND
     */
    WorkflowDefinition getWorkflow(const std::string &workflowId,
                                   const std::optional<std::string> &version = std::nullopt) const;

    std::vector<WorkflowDefinition> listWorkflows() const;

    /**
     * @brief Create, store and start an instance of the latest (or given) version
     * @throws WorkflowError DEFINITION_NOT_FOUND, plus anything startInstance throws
     */
    WorkflowInstance startWorkflow(const std::string &workflowId, json data = json::object(),
                                   const std::optional<std::string> &startedBy = std::nullopt,
                                   const std::optional<std::string> &version = std::nullopt);

    /**
     * @throws WorkflowError INSTANCE_NOT_FOUND, plus anything WorkflowEngine::executeTransition throws
     */
    WorkflowInstance executeTransition(const std::string &instanceId, const std::string &transitionName,
                                       const std::optional<std::string> &triggeredBy = std::nullopt,
                                       const json &data = nullptr);

    /**
     * @throws WorkflowError INSTANCE_NOT_FOUND, INVALID_LIFECYCLE
     */
    WorkflowInstance abortWorkflow(const std::string &instanceId,
                                   const std::optional<std::string> &abortedBy = std::nullopt);

    /**
     * @throws WorkflowError INSTANCE_NOT_FOUND
     */
    WorkflowInstance getWorkflowStatus(const std::string &instanceId) const;

    std::vector<WorkflowInstance> queryWorkflows(const InstanceQuery &query) const;

    /**
     * @return Transition names, empty for unknown or non-running instances
     */
    std::vector<std::string> getAvailableTransitions(const std::string &instanceId) const;

    /**
     * @return false for unknown instances instead of throwing
     */
    bool canExecuteTransition(const std::string &instanceId, const std::string &transitionName) const;

    /**
     * @brief Create, execute and store a flow instance
     * @throws WorkflowError DEFINITION_NOT_FOUND
     */
    FlowRun runFlow(const std::string &flowId, const json &variables = json::object(),
                    const std::optional<std::string> &startedBy = std::nullopt,
                    const std::optional<std::string> &version = std::nullopt);

    /**
     * @brief Complete (approved) or reject a task and optionally advance its instance
     *
     * When transitionName is set, that transition is executed on the task's
     * instance, triggered by the task's effective assignee with the result as
     * history payload.
     *
     * @return The resolved task
     */
    WorkflowTask resolveTask(const std::string &taskId, bool approved, const json &result = nullptr,
                             const std::optional<std::string> &transitionName = std::nullopt);

private:
    WorkflowInstance requireInstance(const std::string &instanceId) const;
    WorkflowDefinition definitionFor(const WorkflowInstance &instance) const;

    std::shared_ptr<IWorkflowStorage> storage_;
    EngineConfig config_;
    WorkflowEngine engine_;
    FlowEngine flowEngine_;
    ApprovalService approvals_;
};

}  // namespace WCE
