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
#include "model/FlowDefinition.h"
#include <memory>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Parser for flow graph definitions
 *
 * Document form:
 * @code
 * {
 *   "name": "order_routing",
 *   "nodes": [
 *     { "id": "start", "type": "start" },
 *     { "id": "check", "type": "decision" },
 *     { "id": "big", "type": "assignment", "config": { "route": "manual" } },
 *     { "id": "small", "type": "assignment", "config": { "route": "auto" } },
 *     { "id": "end", "type": "end" }
 *   ],
 *   "edges": [
 *     { "source": "start", "target": "check" },
 *     { "source": "check", "target": "big", "condition": "amount > 1000" },
 *     { "source": "check", "target": "small" },
 *     { "source": "big", "target": "end" },
 *     { "source": "small", "target": "end" }
 *   ]
 * }
 * @endcode
 *
 * Fatal: missing name, no nodes, nodes without id/type, duplicate node ids,
 * more than one start node, edges without source/target or referencing an
 * unknown node. Reported as warnings: no start node, no end node, orphan
 * nodes, unparsable edge conditions and unknown node types.
 */
class FlowParser {
public:
    FlowParser() = default;
    ~FlowParser() = default;

    /**
     * @brief Parse a flow file
     * @return Parsed flow, nullptr on failure
     */
    std::shared_ptr<FlowDefinition> parseFile(const std::string &filename);

    /**
     * @brief Parse a flow from JSON text
     * @return Parsed flow, nullptr on failure
     */
    std::shared_ptr<FlowDefinition> parseContent(const std::string &content);

    /**
     * @brief Parse an already decoded JSON document
     * @return Parsed flow, nullptr on failure
     */
    std::shared_ptr<FlowDefinition> parseDocument(const json &document);

    bool hasErrors() const;

    const std::vector<std::string> &getErrorMessages() const;

    const std::vector<std::string> &getWarningMessages() const;

    /**
     * @brief Structural report for a flow
     *
     * Missing name, no nodes, start-node count other than one, no end node,
     * edges referencing unknown nodes, nodes without incoming edges (except
     * start) and nodes without outgoing edges (except end).
     *
     * @return One message per issue, empty when the flow is well formed
     */
    static std::vector<std::string> validateFlow(const FlowDefinition &flow);

private:
    void initParsing();
    void addError(const std::string &message);
    void addWarning(const std::string &message);

    std::vector<std::string> errorMessages_;
    std::vector<std::string> warningMessages_;
};

}  // namespace WCE
