// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/WorkflowError.h"

namespace WCE {

const char *errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::INVALID_LIFECYCLE:
        return "InvalidLifecycle";
    case ErrorCode::UNKNOWN_STATE:
        return "UnknownState";
    case ErrorCode::UNKNOWN_TRANSITION:
        return "UnknownTransition";
    case ErrorCode::NODE_NOT_FOUND:
        return "NodeNotFound";
    case ErrorCode::GUARD_REJECTED:
        return "GuardRejected";
    case ErrorCode::HANDLER_FAILURE:
        return "HandlerFailure";
    case ErrorCode::TRAVERSAL_LIMIT_EXCEEDED:
        return "TraversalLimitExceeded";
    case ErrorCode::TASK_NOT_FOUND:
        return "TaskNotFound";
    case ErrorCode::INVALID_TASK_STATE:
        return "InvalidTaskState";
    case ErrorCode::DEFINITION_NOT_FOUND:
        return "DefinitionNotFound";
    case ErrorCode::INSTANCE_NOT_FOUND:
        return "InstanceNotFound";
    case ErrorCode::VALIDATION_ERROR:
        return "ValidationError";
    default:
        return "Unknown";
    }
}

}  // namespace WCE
