// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/FlowDefinition.h"
#include "common/Constants.h"

#include <algorithm>

namespace WCE {

const FlowNode *FlowDefinition::findNode(const std::string &nodeId) const {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&](const FlowNode &node) { return node.id == nodeId; });
    return it != nodes.end() ? &*it : nullptr;
}

const FlowNode *FlowDefinition::findStartNode() const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [](const FlowNode &node) { return node.type == Constants::NODE_START; });
    if (it != nodes.end()) {
        return &*it;
    }
    return nodes.empty() ? nullptr : &nodes.front();
}

std::vector<const FlowEdge *> FlowDefinition::outgoingEdges(const std::string &nodeId) const {
    std::vector<const FlowEdge *> result;
    for (const auto &edge : edges) {
        if (edge.source == nodeId) {
            result.push_back(&edge);
        }
    }
    return result;
}

const std::vector<std::string> &builtinNodeTypes() {
    static const std::vector<std::string> types = {
        Constants::NODE_START,         Constants::NODE_END,           Constants::NODE_DECISION,
        Constants::NODE_ASSIGNMENT,    Constants::NODE_LOOP,          Constants::NODE_CREATE_RECORD,
        Constants::NODE_UPDATE_RECORD, Constants::NODE_DELETE_RECORD, Constants::NODE_GET_RECORD,
        Constants::NODE_HTTP_REQUEST,  Constants::NODE_SCRIPT,        Constants::NODE_WAIT,
        Constants::NODE_SUBFLOW,       Constants::NODE_CONNECTOR_ACTION};
    return types;
}

bool isBuiltinNodeType(const std::string &type) {
    const auto &types = builtinNodeTypes();
    return std::find(types.begin(), types.end(), type) != types.end();
}

}  // namespace WCE
