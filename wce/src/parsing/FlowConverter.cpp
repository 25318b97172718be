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

#include "parsing/FlowConverter.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "parsing/ParsingCommon.h"

#include <map>

namespace WCE {

namespace {

json referenceNames(const std::vector<HookReference> &references) {
    json names = json::array();
    for (const auto &reference : references) {
        names.push_back(referenceName(reference));
    }
    return names;
}

}  // namespace

FlowDefinition FlowConverter::legacyToFlow(const WorkflowDefinition &definition) {
    FlowDefinition flow;
    flow.id = definition.id;
    flow.name = definition.name;
    flow.label = definition.name;
    flow.description = definition.description;
    flow.version = definition.version;
    flow.metadata = definition.metadata;

    std::map<std::string, std::string> stateToNode;
    std::size_t nodeIndex = 0;
    for (const auto &[stateName, state] : definition.states) {
        FlowNode node;
        node.id = "node_" + std::to_string(nodeIndex++);
        node.label = stateName;
        if (state.initial || stateName == definition.initialState) {
            node.type = Constants::NODE_START;
        } else if (state.final) {
            node.type = Constants::NODE_END;
        } else {
            node.type = Constants::NODE_ASSIGNMENT;
        }

        node.config = json::object();
        if (!state.metadata.is_null()) {
            node.config["metadata"] = state.metadata;
        }
        if (!state.onEnter.empty()) {
            node.config["onEnter"] = referenceNames(state.onEnter);
        }
        if (!state.onExit.empty()) {
            node.config["onExit"] = referenceNames(state.onExit);
        }

        stateToNode.emplace(stateName, node.id);
        flow.nodes.push_back(std::move(node));
    }

    std::size_t edgeIndex = 0;
    for (const auto &[stateName, state] : definition.states) {
        const std::string &source = stateToNode.at(stateName);
        for (const auto &[transitionName, transition] : state.transitions) {
            auto target = stateToNode.find(transition.target);
            if (target == stateToNode.end()) {
                LOG_WARN("Skipping transition '{}' of state '{}': unknown target '{}'", transitionName, stateName,
                         transition.target);
                continue;
            }

            FlowEdge edge;
            edge.id = "edge_" + std::to_string(edgeIndex++);
            edge.source = source;
            edge.target = target->second;
            edge.label = transitionName;
            if (!transition.guards.empty()) {
                std::string condition;
                for (const auto &guard : transition.guards) {
                    condition += (condition.empty() ? "" : " && ") + referenceName(guard);
                }
                edge.condition = condition;
            }
            flow.edges.push_back(std::move(edge));
        }
    }

    return flow;
}

WorkflowDefinition FlowConverter::flowToLegacy(const FlowDefinition &flow, const LegacyOptions &options) {
    WorkflowDefinition definition;
    definition.name = flow.name;
    definition.description = flow.description;
    definition.type = options.type.value_or(WorkflowType::SEQUENTIAL);
    definition.version = flow.version.empty() ? Constants::DEFAULT_DEFINITION_VERSION : flow.version;
    definition.metadata = flow.metadata;
    if (options.id) {
        definition.id = *options.id;
    } else {
        definition.id = flow.id.empty() ? ParsingCommon::generateIdFromName(flow.name) : flow.id;
    }

    std::map<std::string, std::string> nodeToState;
    for (const auto &node : flow.nodes) {
        std::string stateName = node.label.empty() ? node.id : node.label;
        nodeToState.emplace(node.id, stateName);

        StateConfig state;
        state.name = stateName;
        state.initial = node.type == Constants::NODE_START;
        state.final = node.type == Constants::NODE_END;
        state.metadata = node.config;

        if (state.initial && definition.initialState.empty()) {
            definition.initialState = stateName;
        }
        definition.states[stateName] = std::move(state);
    }

    for (const auto &edge : flow.edges) {
        auto source = nodeToState.find(edge.source);
        auto target = nodeToState.find(edge.target);
        if (source == nodeToState.end() || target == nodeToState.end()) {
            continue;
        }

        TransitionConfig transition;
        transition.target = target->second;
        if (edge.condition) {
            transition.guards.push_back(*edge.condition);
        }
        std::string transitionName = edge.label ? *edge.label : "to_" + target->second;
        definition.states[source->second].transitions[transitionName] = std::move(transition);
    }

    if (definition.initialState.empty() && !flow.nodes.empty()) {
        definition.initialState = nodeToState.at(flow.nodes.front().id);
        definition.states[definition.initialState].initial = true;
    }

    return definition;
}

}  // namespace WCE
