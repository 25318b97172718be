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
#include <optional>
#include <string>

namespace WCE {

/**
 * @brief Conversion between FSM definitions and flow graphs
 *
 * Lets FSM definitions be shown in a graph editor and simple graphs be run
 * by the step-wise FSM engine. The conversion is structural: guards become
 * edge conditions and vice versa, but their semantics are not translated.
 */
class FlowConverter {
public:
    struct LegacyOptions {
        std::optional<std::string> id;
        std::optional<WorkflowType> type;
    };

    /**
     * @brief FSM definition -> flow graph
     *
     * One node per state (node_<n>, labelled with the state name, typed start
     * for the initial state, end for final states, assignment otherwise; hook
     * names kept in config), one edge per transition (labelled with the
     * transition name, condition = guard names joined with " && ").
     */
    static FlowDefinition legacyToFlow(const WorkflowDefinition &definition);

    /**
     * @brief Flow graph -> FSM definition
     *
     * One state per node named by its label, one transition per edge named by
     * its label or "to_<target>", the edge condition becoming a single guard
     * reference. The initial state is the start node, else the first node.
     */
    static WorkflowDefinition flowToLegacy(const FlowDefinition &flow, const LegacyOptions &options = {});
};

}  // namespace WCE
