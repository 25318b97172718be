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
#include "common/WorkflowError.h"
#include "model/FlowDefinition.h"
#include "model/WorkflowInstance.h"
#include "runtime/EngineConfig.h"
#include "runtime/WorkflowContext.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace WCE {

/**
 * @brief Outcome of one node handler invocation
 */
struct FlowNodeResult {
    bool success = true;
    json output;                          // Object merged into the flow variables on success
    std::string error;                    // Failure reason
    std::optional<std::string> nextEdge;  // Preferred outgoing edge label

    static FlowNodeResult ok(json output = nullptr) {
        FlowNodeResult result;
        result.output = std::move(output);
        return result;
    }

    static FlowNodeResult failure(const std::string &error) {
        FlowNodeResult result;
        result.success = false;
        result.error = error;
        return result;
    }
};

/**
 * @brief Execution context handed to node handlers
 *
 * variables() is the mutable flow variable map seeded from the initial
 * variables of execute(); instanceData() is the instance working memory.
 */
class FlowExecutionContext {
public:
    FlowExecutionContext(const FlowDefinition &flow, WorkflowInstance &instance, json &variables)
        : flow_(flow), instance_(instance), variables_(variables), instanceData_(instance.data) {}

    const FlowDefinition &getFlow() const {
        return flow_;
    }

    const WorkflowInstance &getInstance() const {
        return instance_;
    }

    DataAccessor &variables() {
        return variables_;
    }

    DataAccessor &instanceData() {
        return instanceData_;
    }

private:
    const FlowDefinition &flow_;
    WorkflowInstance &instance_;
    DataAccessor variables_;
    DataAccessor instanceData_;
};

/**
 * @brief Per-node-type callback
 *
 * Returning failure, or throwing, fails the whole flow with HANDLER_FAILURE.
 */
using FlowNodeHandler = std::function<FlowNodeResult(const FlowNode &node, FlowExecutionContext &context)>;

/**
 * @brief Outcome of FlowEngine::execute
 */
struct FlowExecutionResult {
    bool success = false;
    json variables = json::object();  // Accumulated flow variables
    std::string error;
    std::optional<ErrorCode> errorCode;
    std::size_t nodesVisited = 0;
};

/**
 * @brief Batch interpreter for flow graphs
 *
 * execute() walks the graph from the instance's current node, dispatching each
 * node to the handler registered for its type and following outgoing edges
 * until an end node, a dead end, a failure or the traversal bound.
 *
 * Default handlers: start, end, decision and wait are no-ops; assignment
 * copies node.config into the variables; script logs a warning and succeeds
 * without running code. Types without a handler run as no-op successes
 * unless listed in EngineConfig::requiredHandlerTypes.
 */
class FlowEngine {
public:
    FlowEngine();
    explicit FlowEngine(const EngineConfig &config);

    FlowEngine(const FlowEngine &) = delete;
    FlowEngine &operator=(const FlowEngine &) = delete;

    /**
     * @brief Register (or replace) the handler for a node type
     */
    void registerHandler(const std::string &nodeType, FlowNodeHandler handler);

    bool hasHandler(const std::string &nodeType) const;

    /**
     * @brief Create a pending instance positioned at the start node
     *
     * workflowId is the flow id (the name when no id is set).
     */
    WorkflowInstance createInstance(const FlowDefinition &flow, json data = json::object(),
                                    const std::optional<std::string> &startedBy = std::nullopt) const;

    /**
     * @brief Run a pending instance to completion or failure
     *
     * Run-time failures (NODE_NOT_FOUND, HANDLER_FAILURE,
     * TRAVERSAL_LIMIT_EXCEEDED) are reported in the result and mark the
     * instance failed; they are not thrown.
     *
     * @throws WorkflowError INVALID_LIFECYCLE unless the instance is pending
     */
    FlowExecutionResult execute(const FlowDefinition &flow, WorkflowInstance &instance,
                                const json &initialVariables = json::object()) const;

    /**
     * @brief Choose the next node after node
     *
     * An edge whose label equals preferredEdge wins. Decision nodes then take
     * the first edge whose condition holds, other nodes skip conditions; both
     * fall back to the first unconditioned edge and then the first edge.
     *
     * @return Target node id, or nullopt when node has no outgoing edges
     */
    std::optional<std::string> resolveNextNode(const FlowDefinition &flow, const FlowNode &node, const json &variables,
                                               const std::optional<std::string> &preferredEdge = std::nullopt) const;

    /**
     * @brief Node types used by the flow that have no registered handler (sorted, unique)
     */
    std::vector<std::string> findUnhandledNodeTypes(const FlowDefinition &flow) const;

    std::size_t getMaxNodes() const {
        return config_.maxFlowNodes;
    }

private:
    void registerDefaultHandlers();
    std::optional<FlowNodeHandler> findHandler(const std::string &nodeType) const;
    FlowNodeResult runNode(const FlowNode &node, FlowExecutionContext &context) const;

    FlowExecutionResult fail(WorkflowInstance &instance, json &variables, ErrorCode code, const std::string &error,
                             std::size_t nodesVisited) const;
    FlowExecutionResult complete(WorkflowInstance &instance, json &variables, std::size_t nodesVisited) const;

    EngineConfig config_;
    std::unordered_map<std::string, FlowNodeHandler> handlers_;
    mutable std::mutex handlerMutex_;
};

}  // namespace WCE
