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

#include "runtime/FlowEngine.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "runtime/ConditionEvaluator.h"

#include <set>
#include <stdexcept>

namespace WCE {

FlowEngine::FlowEngine() : FlowEngine(EngineConfig{}) {}

FlowEngine::FlowEngine(const EngineConfig &config) : config_(config) {
    if (config_.maxFlowNodes == 0) {
        config_.maxFlowNodes = Constants::DEFAULT_MAX_FLOW_NODES;
    }
    registerDefaultHandlers();
}

void FlowEngine::registerHandler(const std::string &nodeType, FlowNodeHandler handler) {
    if (nodeType.empty()) {
        throw std::invalid_argument("Node type must not be empty");
    }
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_[nodeType] = std::move(handler);
    LOG_DEBUG("Registered handler for node type '{}'", nodeType);
}

bool FlowEngine::hasHandler(const std::string &nodeType) const {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    return handlers_.find(nodeType) != handlers_.end();
}

WorkflowInstance FlowEngine::createInstance(const FlowDefinition &flow, json data,
                                            const std::optional<std::string> &startedBy) const {
    WorkflowInstance instance;
    instance.id = UniqueIdGenerator::generateFlowInstanceId();
    instance.workflowId = flow.id.empty() ? flow.name : flow.id;
    instance.version = flow.version.empty() ? Constants::DEFAULT_DEFINITION_VERSION : flow.version;
    const FlowNode *startNode = flow.findStartNode();
    instance.currentState = startNode ? startNode->id : "";
    instance.status = InstanceStatus::PENDING;
    instance.data = data.is_object() ? std::move(data) : json::object();
    instance.createdAt = now();
    instance.startedBy = startedBy;
    return instance;
}

FlowExecutionResult FlowEngine::execute(const FlowDefinition &flow, WorkflowInstance &instance,
                                        const json &initialVariables) const {
    if (instance.status != InstanceStatus::PENDING) {
        throw WorkflowError(ErrorCode::INVALID_LIFECYCLE, std::string("Cannot execute flow in status: ") +
                                                              instanceStatusToString(instance.status));
    }

    instance.status = InstanceStatus::RUNNING;
    instance.startedAt = now();

    json variables = initialVariables.is_object() ? initialVariables : json::object();
    FlowExecutionContext context(flow, instance, variables);

    std::unordered_map<std::string, const FlowNode *> nodeIndex;
    nodeIndex.reserve(flow.nodes.size());
    for (const auto &node : flow.nodes) {
        nodeIndex.emplace(node.id, &node);
    }

    LOG_INFO("Executing flow '{}' as instance {} (limit {} nodes)", instance.workflowId, instance.id,
             config_.maxFlowNodes);

    std::size_t nodesVisited = 0;
    while (!instance.currentState.empty() && nodesVisited < config_.maxFlowNodes) {
        auto found = nodeIndex.find(instance.currentState);
        if (found == nodeIndex.end()) {
            return fail(instance, variables, ErrorCode::NODE_NOT_FOUND, "Node not found: " + instance.currentState,
                        nodesVisited);
        }
        const FlowNode &node = *found->second;
        nodesVisited++;

        FlowNodeResult result = runNode(node, context);
        if (!result.success) {
            // Output of a failed node is ignored
            std::string error = result.error.empty() ? "Node " + node.id + " failed" : result.error;
            return fail(instance, variables, ErrorCode::HANDLER_FAILURE, error, nodesVisited);
        }

        if (result.output.is_object()) {
            context.variables().merge(result.output);
        } else if (!result.output.is_null()) {
            LOG_WARN("Ignoring non-object output of node '{}' ({})", node.id, node.type);
        }

        if (node.type == Constants::NODE_END) {
            return complete(instance, variables, nodesVisited);
        }

        auto next = resolveNextNode(flow, node, variables, result.nextEdge);
        if (!next) {
            // Graphs may terminate without an explicit end node
            LOG_DEBUG("Node '{}' has no outgoing edges, completing flow", node.id);
            return complete(instance, variables, nodesVisited);
        }

        StateHistoryEntry entry;
        entry.fromState = node.id;
        entry.toState = *next;
        entry.transition = node.type + "->";
        entry.timestamp = now();
        entry.triggeredBy = instance.startedBy;
        instance.history.push_back(std::move(entry));

        instance.currentState = *next;
    }

    if (instance.currentState.empty()) {
        // Empty graph
        return complete(instance, variables, nodesVisited);
    }

    LOG_ERROR("Flow '{}' instance {} exceeded the node limit of {}", instance.workflowId, instance.id,
              config_.maxFlowNodes);
    return fail(instance, variables, ErrorCode::TRAVERSAL_LIMIT_EXCEEDED,
                "max node limit exceeded (" + std::to_string(config_.maxFlowNodes) + ")", nodesVisited);
}

std::optional<std::string> FlowEngine::resolveNextNode(const FlowDefinition &flow, const FlowNode &node,
                                                       const json &variables,
                                                       const std::optional<std::string> &preferredEdge) const {
    auto outgoing = flow.outgoingEdges(node.id);
    if (outgoing.empty()) {
        return std::nullopt;
    }

    if (preferredEdge) {
        for (const FlowEdge *edge : outgoing) {
            if (edge->label && *edge->label == *preferredEdge) {
                return edge->target;
            }
        }
        LOG_DEBUG("Node '{}' requested edge '{}' which does not exist, using default routing", node.id,
                  *preferredEdge);
    }

    if (node.type == Constants::NODE_DECISION) {
        for (const FlowEdge *edge : outgoing) {
            if (edge->condition && ConditionEvaluator::evaluate(*edge->condition, variables)) {
                return edge->target;
            }
        }
    }

    for (const FlowEdge *edge : outgoing) {
        if (!edge->condition) {
            return edge->target;
        }
    }
    return outgoing.front()->target;
}

std::vector<std::string> FlowEngine::findUnhandledNodeTypes(const FlowDefinition &flow) const {
    std::set<std::string> unhandled;
    for (const auto &node : flow.nodes) {
        if (!hasHandler(node.type)) {
            unhandled.insert(node.type);
        }
    }
    return std::vector<std::string>(unhandled.begin(), unhandled.end());
}

void FlowEngine::registerDefaultHandlers() {
    auto passThrough = [](const FlowNode &, FlowExecutionContext &) { return FlowNodeResult::ok(); };

    registerHandler(Constants::NODE_START, passThrough);
    registerHandler(Constants::NODE_END, passThrough);
    // Routing for decision nodes happens in resolveNextNode
    registerHandler(Constants::NODE_DECISION, passThrough);
    registerHandler(Constants::NODE_WAIT, passThrough);

    registerHandler(Constants::NODE_ASSIGNMENT, [](const FlowNode &node, FlowExecutionContext &) {
        return FlowNodeResult::ok(node.config.is_object() ? node.config : json(nullptr));
    });

    registerHandler(Constants::NODE_SCRIPT, [](const FlowNode &node, FlowExecutionContext &) {
        if (node.config.is_object() && node.config.contains("script")) {
            LOG_WARN("Default script handler used for node '{}', script not executed. Register a sandboxed "
                     "handler for production",
                     node.id);
        }
        return FlowNodeResult::ok();
    });
}

std::optional<FlowNodeHandler> FlowEngine::findHandler(const std::string &nodeType) const {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    auto it = handlers_.find(nodeType);
    if (it == handlers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

FlowNodeResult FlowEngine::runNode(const FlowNode &node, FlowExecutionContext &context) const {
    auto handler = findHandler(node.type);
    if (!handler) {
        if (config_.isHandlerRequired(node.type)) {
            return FlowNodeResult::failure("No handler registered for required node type '" + node.type + "'");
        }
        LOG_DEBUG("No handler for node type '{}', node '{}' runs as no-op", node.type, node.id);
        return FlowNodeResult::ok();
    }

    try {
        return (*handler)(node, context);
    } catch (const std::exception &e) {
        LOG_ERROR("Handler for node '{}' ({}) threw: {}", node.id, node.type, e.what());
        return FlowNodeResult::failure(e.what());
    }
}

FlowExecutionResult FlowEngine::fail(WorkflowInstance &instance, json &variables, ErrorCode code,
                                     const std::string &error, std::size_t nodesVisited) const {
    instance.status = InstanceStatus::FAILED;
    instance.failedAt = now();
    instance.error = error;

    LOG_WARN("Flow instance {} failed at node '{}' ({}): {}", instance.id, instance.currentState,
             errorCodeToString(code), error);

    FlowExecutionResult result;
    result.success = false;
    result.variables = std::move(variables);
    result.error = error;
    result.errorCode = code;
    result.nodesVisited = nodesVisited;
    return result;
}

FlowExecutionResult FlowEngine::complete(WorkflowInstance &instance, json &variables, std::size_t nodesVisited) const {
    instance.status = InstanceStatus::COMPLETED;
    instance.completedAt = now();

    LOG_INFO("Flow instance {} completed at node '{}' after {} nodes", instance.id, instance.currentState,
             nodesVisited);

    FlowExecutionResult result;
    result.success = true;
    result.variables = std::move(variables);
    result.nodesVisited = nodesVisited;
    return result;
}

}  // namespace WCE
