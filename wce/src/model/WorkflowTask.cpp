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

#include "model/WorkflowTask.h"
#include "common/JsonUtils.h"

#include <stdexcept>

namespace WCE {

namespace {

void putTimestamp(json &j, const char *key, const std::optional<Timestamp> &value) {
    if (value) {
        j[key] = JsonUtils::formatTimestamp(*value);
    }
}

void putString(json &j, const char *key, const std::optional<std::string> &value) {
    if (value) {
        j[key] = *value;
    }
}

std::optional<Timestamp> readTimestamp(const json &j, const char *key) {
    if (!JsonUtils::hasKey(j, key)) {
        return std::nullopt;
    }
    auto parsed = JsonUtils::parseTimestamp(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("Malformed timestamp in field '") + key + "'");
    }
    return parsed;
}

std::optional<std::string> readString(const json &j, const char *key) {
    if (!JsonUtils::hasKey(j, key)) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

}  // namespace

const char *taskStatusToString(TaskStatus status) {
    switch (status) {
    case TaskStatus::PENDING:
        return "pending";
    case TaskStatus::COMPLETED:
        return "completed";
    case TaskStatus::REJECTED:
        return "rejected";
    default:
        return "unknown";
    }
}

std::optional<TaskStatus> taskStatusFromString(const std::string &name) {
    if (name == "pending") {
        return TaskStatus::PENDING;
    } else if (name == "completed") {
        return TaskStatus::COMPLETED;
    } else if (name == "rejected") {
        return TaskStatus::REJECTED;
    }
    return std::nullopt;
}

const std::string &WorkflowTask::effectiveAssignee() const {
    if (escalatedTo) {
        return *escalatedTo;
    }
    if (delegatedTo) {
        return *delegatedTo;
    }
    return assignedTo;
}

void to_json(json &j, const WorkflowTask &task) {
    j = json{{"id", task.id},
             {"instanceId", task.instanceId},
             {"name", task.name},
             {"description", task.description},
             {"assignedTo", task.assignedTo},
             {"status", taskStatusToString(task.status)},
             {"data", task.data},
             {"autoEscalate", task.autoEscalate},
             {"createdAt", JsonUtils::formatTimestamp(task.createdAt)}};
    putTimestamp(j, "dueDate", task.dueDate);
    putString(j, "escalationTarget", task.escalationTarget);
    putTimestamp(j, "completedAt", task.completedAt);
    if (!task.result.is_null()) {
        j["result"] = task.result;
    }

    putString(j, "originalAssignee", task.originalAssignee);
    putString(j, "delegatedTo", task.delegatedTo);
    putString(j, "delegatedBy", task.delegatedBy);
    putTimestamp(j, "delegatedAt", task.delegatedAt);
    putString(j, "delegationReason", task.delegationReason);

    putString(j, "escalatedTo", task.escalatedTo);
    putString(j, "escalatedBy", task.escalatedBy);
    putTimestamp(j, "escalatedAt", task.escalatedAt);
    putString(j, "escalationReason", task.escalationReason);
}

void from_json(const json &j, WorkflowTask &task) {
    task.id = j.at("id").get<std::string>();
    task.instanceId = JsonUtils::getString(j, "instanceId");
    task.name = JsonUtils::getString(j, "name");
    task.description = JsonUtils::getString(j, "description");
    task.assignedTo = JsonUtils::getString(j, "assignedTo");

    auto status = taskStatusFromString(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("Unknown task status: " + j.at("status").get<std::string>());
    }
    task.status = *status;

    task.data = j.contains("data") ? j.at("data") : json::object();
    task.dueDate = readTimestamp(j, "dueDate");
    task.autoEscalate = JsonUtils::getBool(j, "autoEscalate");
    task.escalationTarget = readString(j, "escalationTarget");
    auto createdAt = readTimestamp(j, "createdAt");
    task.createdAt = createdAt ? *createdAt : Timestamp{};
    task.completedAt = readTimestamp(j, "completedAt");
    task.result = j.contains("result") ? j.at("result") : json(nullptr);

    task.originalAssignee = readString(j, "originalAssignee");
    task.delegatedTo = readString(j, "delegatedTo");
    task.delegatedBy = readString(j, "delegatedBy");
    task.delegatedAt = readTimestamp(j, "delegatedAt");
    task.delegationReason = readString(j, "delegationReason");

    task.escalatedTo = readString(j, "escalatedTo");
    task.escalatedBy = readString(j, "escalatedBy");
    task.escalatedAt = readTimestamp(j, "escalatedAt");
    task.escalationReason = readString(j, "escalationReason");
}

}  // namespace WCE
