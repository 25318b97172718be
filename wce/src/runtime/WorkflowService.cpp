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

#include "runtime/WorkflowService.h"
#include "common/Logger.h"
#include "common/WorkflowError.h"
#include "parsing/FlowParser.h"
#include "parsing/WorkflowParser.h"

#include <stdexcept>

namespace WCE {

namespace {

std::string joinMessages(const std::vector<std::string> &messages) {
    std::string joined;
    for (const auto &message : messages) {
        joined += (joined.empty() ? "" : "; ") + message;
    }
    return joined;
}

std::shared_ptr<IWorkflowStorage> requireStorage(std::shared_ptr<IWorkflowStorage> storage) {
    if (!storage) {
        throw std::invalid_argument("WorkflowService requires a storage backend");
    }
    return storage;
}

}  // namespace

WorkflowService::WorkflowService(std::shared_ptr<IWorkflowStorage> storage, const EngineConfig &config)
    : storage_(requireStorage(std::move(storage))), config_(config), flowEngine_(config), approvals_(*storage_) {}

void WorkflowService::registerWorkflow(const WorkflowDefinition &definition) {
    auto errors = WorkflowParser::validateWorkflowDefinition(definition);
    if (!errors.empty()) {
        throw WorkflowError(ErrorCode::VALIDATION_ERROR,
                            "Invalid workflow definition \"" + definition.id + "\": " + joinMessages(errors));
    }

    for (const auto &reference : engine_.findUnresolvedReferences(definition)) {
        LOG_WARN("Workflow {} references unregistered {}", definition.id, reference);
    }

    storage_->saveDefinition(definition);
    LOG_INFO("Registered workflow {} v{}", definition.id, definition.version);
}

void WorkflowService::registerFlow(const FlowDefinition &flow) {
    std::vector<std::string> fatal;
    if (flow.name.empty() && flow.id.empty()) {
        fatal.push_back("Flow must have a name");
    }
    if (flow.nodes.empty()) {
        fatal.push_back("Flow must have at least one node");
    }
    for (const auto &edge : flow.edges) {
        if (!flow.findNode(edge.source) || !flow.findNode(edge.target)) {
            fatal.push_back("Edge " + edge.id + " references an unknown node");
        }
    }
    if (!fatal.empty()) {
        throw WorkflowError(ErrorCode::VALIDATION_ERROR, "Invalid flow \"" + flow.id + "\": " + joinMessages(fatal));
    }

    for (const auto &issue : FlowParser::validateFlow(flow)) {
        LOG_WARN("Flow {}: {}", flow.id, issue);
    }
    for (const auto &type : flowEngine_.findUnhandledNodeTypes(flow)) {
        if (config_.isHandlerRequired(type)) {
            LOG_WARN("Flow {} uses node type '{}' which requires a handler and has none", flow.id, type);
        } else {
            LOG_DEBUG("Flow {} uses node type '{}' without a handler, it will run as a no-op", flow.id, type);
        }
    }

    FlowDefinition stored = flow;
    if (stored.id.empty()) {
        stored.id = stored.name;
    }
    storage_->saveFlow(stored);
    LOG_INFO("Registered flow {} v{}", stored.id, stored.version);
}

WorkflowDefinition WorkflowService::getWorkflow(const std::string &workflowId,
                                                const std::optional<std::string> &version) const {
    auto definition = storage_->getDefinition(workflowId, version);
    if (!definition) {
        throw WorkflowError(ErrorCode::DEFINITION_NOT_FOUND,
                            "Workflow definition not found: " + workflowId + (version ? " v" + *version : ""));
    }
    return *definition;
}

std::vector<WorkflowDefinition> WorkflowService::listWorkflows() const {
    return storage_->listDefinitions();
}

WorkflowInstance WorkflowService::startWorkflow(const std::string &workflowId, json data,
                                                const std::optional<std::string> &startedBy,
                                                const std::optional<std::string> &version) {
    WorkflowDefinition definition = getWorkflow(workflowId, version);

    WorkflowInstance instance = engine_.createInstance(definition, std::move(data), startedBy);
    storage_->saveInstance(instance);

    try {
        engine_.startInstance(instance, definition);
    } catch (const std::exception &) {
        storage_->updateInstance(instance);
        throw;
    }

    storage_->updateInstance(instance);
    return instance;
}

WorkflowInstance WorkflowService::executeTransition(const std::string &instanceId, const std::string &transitionName,
                                                    const std::optional<std::string> &triggeredBy, const json &data) {
    WorkflowInstance instance = requireInstance(instanceId);
    WorkflowDefinition definition = definitionFor(instance);

    try {
        engine_.executeTransition(instance, definition, transitionName, triggeredBy, data);
    } catch (const std::exception &) {
        // Persist whatever the engine managed to apply before the failure
        storage_->updateInstance(instance);
        throw;
    }

    storage_->updateInstance(instance);
    return instance;
}

WorkflowInstance WorkflowService::abortWorkflow(const std::string &instanceId,
                                                const std::optional<std::string> &abortedBy) {
    WorkflowInstance instance = requireInstance(instanceId);
    WorkflowDefinition definition = definitionFor(instance);

    try {
        engine_.abortInstance(instance, definition, abortedBy);
    } catch (const std::exception &) {
        storage_->updateInstance(instance);
        throw;
    }

    storage_->updateInstance(instance);
    return instance;
}

WorkflowInstance WorkflowService::getWorkflowStatus(const std::string &instanceId) const {
    return requireInstance(instanceId);
}

std::vector<WorkflowInstance> WorkflowService::queryWorkflows(const InstanceQuery &query) const {
    return storage_->queryInstances(query);
}

std::vector<std::string> WorkflowService::getAvailableTransitions(const std::string &instanceId) const {
    auto instance = storage_->getInstance(instanceId);
    if (!instance) {
        return {};
    }
    auto definition = storage_->getDefinition(instance->workflowId, instance->version);
    if (!definition) {
        return {};
    }
    return engine_.getAvailableTransitions(*instance, *definition);
}

bool WorkflowService::canExecuteTransition(const std::string &instanceId, const std::string &transitionName) const {
    auto instance = storage_->getInstance(instanceId);
    if (!instance) {
        return false;
    }
    auto definition = storage_->getDefinition(instance->workflowId, instance->version);
    if (!definition) {
        return false;
    }
    return engine_.canExecuteTransition(*instance, *definition, transitionName);
}

FlowRun WorkflowService::runFlow(const std::string &flowId, const json &variables,
                                 const std::optional<std::string> &startedBy,
                                 const std::optional<std::string> &version) {
    auto flow = storage_->getFlow(flowId, version);
    if (!flow) {
        throw WorkflowError(ErrorCode::DEFINITION_NOT_FOUND, "Flow definition not found: " + flowId);
    }

    FlowRun run;
    run.instance = flowEngine_.createInstance(*flow, json::object(), startedBy);
    storage_->saveInstance(run.instance);

    run.result = flowEngine_.execute(*flow, run.instance, variables);
    storage_->updateInstance(run.instance);
    return run;
}

WorkflowTask WorkflowService::resolveTask(const std::string &taskId, bool approved, const json &result,
                                          const std::optional<std::string> &transitionName) {
    WorkflowTask task = approved ? approvals_.completeTask(taskId, result) : approvals_.rejectTask(taskId, result);

    if (transitionName) {
        executeTransition(task.instanceId, *transitionName, task.effectiveAssignee(), result);
    }
    return task;
}

WorkflowInstance WorkflowService::requireInstance(const std::string &instanceId) const {
    auto instance = storage_->getInstance(instanceId);
    if (!instance) {
        throw WorkflowError(ErrorCode::INSTANCE_NOT_FOUND, "Workflow instance not found: " + instanceId);
    }
    return *instance;
}

WorkflowDefinition WorkflowService::definitionFor(const WorkflowInstance &instance) const {
    return getWorkflow(instance.workflowId, instance.version);
}

}  // namespace WCE
