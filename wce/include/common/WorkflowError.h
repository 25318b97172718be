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

#include <stdexcept>
#include <string>

namespace WCE {

/**
 * @brief Error taxonomy shared by the engines, the approval service and the parsers
 */
enum class ErrorCode {
    INVALID_LIFECYCLE,         // Operation against an instance in the wrong status
    UNKNOWN_STATE,             // Instance refers to a state the definition does not contain
    UNKNOWN_TRANSITION,        // Transition name not defined on the current state
    NODE_NOT_FOUND,            // Flow node id does not exist
    GUARD_REJECTED,            // Guard evaluated false or could not be resolved
    HANDLER_FAILURE,           // Flow node handler reported failure or threw
    TRAVERSAL_LIMIT_EXCEEDED,  // Flow traversal bound tripped
    TASK_NOT_FOUND,            // Task id unknown to storage
    INVALID_TASK_STATE,        // Task mutation attempted on a non-pending task
    DEFINITION_NOT_FOUND,      // Definition id/version unknown to storage
    INSTANCE_NOT_FOUND,        // Instance id unknown to storage
    VALIDATION_ERROR           // Definition failed structural validation
};

/**
 * @brief Stable string form of an error code ("InvalidLifecycle", "GuardRejected", ...)
 */
const char *errorCodeToString(ErrorCode code);

/**
 * @brief Exception raised for workflow precondition and lookup failures
 *
 * Business-rule rejections (GUARD_REJECTED) and system faults share this type;
 * callers distinguish them through code().
 */
class WorkflowError : public std::runtime_error {
public:
    WorkflowError(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept {
        return code_;
    }

private:
    ErrorCode code_;
};

}  // namespace WCE
