// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "model/WorkflowDefinition.h"

namespace WCE {

const char *workflowTypeToString(WorkflowType type) {
    switch (type) {
    case WorkflowType::APPROVAL:
        return "approval";
    case WorkflowType::SEQUENTIAL:
        return "sequential";
    case WorkflowType::PARALLEL:
        return "parallel";
    case WorkflowType::CONDITIONAL:
        return "conditional";
    default:
        return "sequential";
    }
}

std::optional<WorkflowType> workflowTypeFromString(const std::string &name) {
    if (name == "approval") {
        return WorkflowType::APPROVAL;
    } else if (name == "sequential") {
        return WorkflowType::SEQUENTIAL;
    } else if (name == "parallel") {
        return WorkflowType::PARALLEL;
    } else if (name == "conditional") {
        return WorkflowType::CONDITIONAL;
    }
    return std::nullopt;
}

}  // namespace WCE
