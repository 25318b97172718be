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

#include "parsing/FlowParser.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "parsing/ParsingCommon.h"
#include "runtime/ConditionEvaluator.h"

#include <algorithm>
#include <unordered_set>

namespace WCE {

std::shared_ptr<FlowDefinition> FlowParser::parseFile(const std::string &filename) {
    initParsing();

    auto content = ParsingCommon::readFile(filename);
    if (!content) {
        addError("File not found: " + filename);
        return nullptr;
    }

    LOG_INFO("Parsing flow file: {}", filename);
    return parseContent(*content);
}

std::shared_ptr<FlowDefinition> FlowParser::parseContent(const std::string &content) {
    initParsing();

    std::string parseError;
    auto document = JsonUtils::parseJson(content, &parseError);
    if (!document) {
        addError("Invalid flow definition: " + parseError);
        return nullptr;
    }
    return parseDocument(*document);
}

std::shared_ptr<FlowDefinition> FlowParser::parseDocument(const json &document) {
    initParsing();

    if (!document.is_object()) {
        addError("Invalid flow definition: document must be an object");
        return nullptr;
    }

    auto flow = std::make_shared<FlowDefinition>();
    flow->name = JsonUtils::getString(document, "name");
    if (flow->name.empty()) {
        addError("Flow must have a name");
    }
    flow->id = JsonUtils::getString(document, "id");
    if (flow->id.empty()) {
        flow->id = ParsingCommon::generateIdFromName(flow->name);
    }
    flow->label = JsonUtils::getString(document, "label", flow->name);
    flow->description = JsonUtils::getString(document, "description");
    flow->version = ParsingCommon::readVersion(document, Constants::DEFAULT_DEFINITION_VERSION);
    flow->metadata = document.contains("metadata") ? document.at("metadata") : json(nullptr);

    const json nodesJson = document.contains("nodes") ? document.at("nodes") : json(nullptr);
    if (!nodesJson.is_array() || nodesJson.empty()) {
        addError("Flow must have at least one node");
        return nullptr;
    }

    std::unordered_set<std::string> nodeIds;
    for (std::size_t i = 0; i < nodesJson.size(); ++i) {
        const json &nodeJson = nodesJson[i];
        if (!nodeJson.is_object()) {
            addError("Node at index " + std::to_string(i) + " must be an object");
            continue;
        }

        FlowNode node;
        node.id = JsonUtils::getString(nodeJson, "id");
        node.type = JsonUtils::getString(nodeJson, "type");
        if (node.id.empty()) {
            addError("Node at index " + std::to_string(i) + " must have an id");
            continue;
        }
        if (node.type.empty()) {
            addError("Node " + node.id + " must have a type");
            continue;
        }
        if (!nodeIds.insert(node.id).second) {
            addError("Duplicate node id: " + node.id);
            continue;
        }
        if (!isBuiltinNodeType(node.type)) {
            addWarning("Node " + node.id + " has custom type '" + node.type + "'");
        }

        node.label = JsonUtils::getString(nodeJson, "label", node.id);
        if (nodeJson.contains("config") && !nodeJson.at("config").is_null()) {
            if (!nodeJson.at("config").is_object()) {
                addError("Config of node " + node.id + " must be an object");
                continue;
            }
            node.config = nodeJson.at("config");
        }
        node.position = nodeJson.contains("position") ? nodeJson.at("position") : json(nullptr);
        flow->nodes.push_back(std::move(node));
    }

    const json edgesJson = document.contains("edges") ? document.at("edges") : json::array();
    if (!edgesJson.is_array()) {
        addError("Flow edges must be an array");
    } else {
        for (std::size_t i = 0; i < edgesJson.size(); ++i) {
            const json &edgeJson = edgesJson[i];
            if (!edgeJson.is_object()) {
                addError("Edge at index " + std::to_string(i) + " must be an object");
                continue;
            }

            FlowEdge edge;
            edge.id = JsonUtils::getString(edgeJson, "id", "edge_" + std::to_string(i));
            edge.source = JsonUtils::getString(edgeJson, "source");
            edge.target = JsonUtils::getString(edgeJson, "target");
            if (edge.source.empty() || edge.target.empty()) {
                addError("Edge " + edge.id + " must have a source and a target");
                continue;
            }
            if (JsonUtils::hasKey(edgeJson, "condition")) {
                edge.condition = JsonUtils::getString(edgeJson, "condition");
                if (!ConditionEvaluator::parse(*edge.condition)) {
                    addWarning("Edge " + edge.id + " has an unparsable condition '" + *edge.condition +
                               "' that always evaluates to false");
                }
            }
            if (JsonUtils::hasKey(edgeJson, "label")) {
                edge.label = JsonUtils::getString(edgeJson, "label");
            }
            flow->edges.push_back(std::move(edge));
        }
    }

    for (const auto &edge : flow->edges) {
        if (!nodeIds.count(edge.source)) {
            addError("Edge " + edge.id + " references unknown source node: " + edge.source);
        }
        if (!nodeIds.count(edge.target)) {
            addError("Edge " + edge.id + " references unknown target node: " + edge.target);
        }
    }

    auto startCount = std::count_if(flow->nodes.begin(), flow->nodes.end(),
                                    [](const FlowNode &node) { return node.type == Constants::NODE_START; });
    if (startCount > 1) {
        addError("Flow must have exactly one start node, found " + std::to_string(startCount));
    }

    if (hasErrors()) {
        return nullptr;
    }

    // Non-fatal structural findings; execution handles these cases
    for (const auto &issue : validateFlow(*flow)) {
        addWarning(issue);
    }

    LOG_DEBUG("Parsed flow '{}' ({} nodes, {} edges)", flow->name, flow->nodes.size(), flow->edges.size());
    return flow;
}

bool FlowParser::hasErrors() const {
    return !errorMessages_.empty();
}

const std::vector<std::string> &FlowParser::getErrorMessages() const {
    return errorMessages_;
}

const std::vector<std::string> &FlowParser::getWarningMessages() const {
    return warningMessages_;
}

std::vector<std::string> FlowParser::validateFlow(const FlowDefinition &flow) {
    std::vector<std::string> errors;

    if (flow.name.empty()) {
        errors.push_back("Flow must have a name");
    }
    if (flow.nodes.empty()) {
        errors.push_back("Flow must have at least one node");
    }

    auto startCount = std::count_if(flow.nodes.begin(), flow.nodes.end(),
                                    [](const FlowNode &node) { return node.type == Constants::NODE_START; });
    auto endCount = std::count_if(flow.nodes.begin(), flow.nodes.end(),
                                  [](const FlowNode &node) { return node.type == Constants::NODE_END; });
    if (startCount == 0) {
        errors.push_back("Flow must have at least one start node");
    } else if (startCount > 1) {
        errors.push_back("Flow should have exactly one start node");
    }
    if (endCount == 0) {
        errors.push_back("Flow must have at least one end node");
    }

    for (const auto &edge : flow.edges) {
        if (!flow.findNode(edge.source)) {
            errors.push_back("Edge " + edge.id + " references unknown source node: " + edge.source);
        }
        if (!flow.findNode(edge.target)) {
            errors.push_back("Edge " + edge.id + " references unknown target node: " + edge.target);
        }
    }

    for (const auto &node : flow.nodes) {
        if (node.type == Constants::NODE_START) {
            continue;
        }
        bool hasIncoming = std::any_of(flow.edges.begin(), flow.edges.end(),
                                       [&](const FlowEdge &edge) { return edge.target == node.id; });
        if (!hasIncoming) {
            errors.push_back("Node " + node.label + " (" + node.id + ") has no incoming edges");
        }
    }

    for (const auto &node : flow.nodes) {
        if (node.type == Constants::NODE_END) {
            continue;
        }
        if (flow.outgoingEdges(node.id).empty()) {
            errors.push_back("Node " + node.label + " (" + node.id + ") has no outgoing edges");
        }
    }

    return errors;
}

void FlowParser::initParsing() {
    errorMessages_.clear();
    warningMessages_.clear();
}

void FlowParser::addError(const std::string &message) {
    LOG_ERROR("FlowParser - {}", message);
    errorMessages_.push_back(message);
}

void FlowParser::addWarning(const std::string &message) {
    LOG_WARN("FlowParser - {}", message);
    warningMessages_.push_back(message);
}

}  // namespace WCE
