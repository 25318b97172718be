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
#include <optional>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Typed node of a flow graph
 *
 * The type is one of the names in Constants (NODE_START, NODE_DECISION, ...)
 * or a custom type served by a registered handler. config is interpreted by
 * the handler; position carries editor layout and has no execution meaning.
 */
struct FlowNode {
    std::string id;
    std::string type;
    std::string label;
    json config = json::object();
    json position;
};

/**
 * @brief Directed edge between two nodes, optionally conditional and/or labelled
 */
struct FlowEdge {
    std::string id;
    std::string source;
    std::string target;
    std::optional<std::string> condition;
    std::optional<std::string> label;
};

/**
 * @brief Immutable graph workflow template
 */
struct FlowDefinition {
    std::string id;
    std::string name;
    std::string label;
    std::string description;
    std::string version;
    std::vector<FlowNode> nodes;
    std::vector<FlowEdge> edges;
    json metadata;

    const FlowNode *findNode(const std::string &nodeId) const;

    /**
     * @brief First node typed "start", or the first node when none is tagged
     * @return nullptr for an empty graph
     */
    const FlowNode *findStartNode() const;

    /**
     * @brief Edges whose source is nodeId, in definition order
     */
    std::vector<const FlowEdge *> outgoingEdges(const std::string &nodeId) const;
};

/**
 * @brief Whether a node type is one of the built-in types
 */
bool isBuiltinNodeType(const std::string &type);

/**
 * @brief All built-in node type names
 */
const std::vector<std::string> &builtinNodeTypes();

}  // namespace WCE
