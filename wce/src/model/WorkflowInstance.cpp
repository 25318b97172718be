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

#include "model/WorkflowInstance.h"
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

const char *instanceStatusToString(InstanceStatus status) {
    switch (status) {
    case InstanceStatus::PENDING:
        return "pending";
    case InstanceStatus::RUNNING:
        return "running";
    case InstanceStatus::COMPLETED:
        return "completed";
    case InstanceStatus::ABORTED:
        return "aborted";
    case InstanceStatus::FAILED:
        return "failed";
    default:
        return "unknown";
    }
}

std::optional<InstanceStatus> instanceStatusFromString(const std::string &name) {
    if (name == "pending") {
        return InstanceStatus::PENDING;
    } else if (name == "running") {
        return InstanceStatus::RUNNING;
    } else if (name == "completed") {
        return InstanceStatus::COMPLETED;
    } else if (name == "aborted") {
        return InstanceStatus::ABORTED;
    } else if (name == "failed") {
        return InstanceStatus::FAILED;
    }
    return std::nullopt;
}

bool isTerminalStatus(InstanceStatus status) {
    return status == InstanceStatus::COMPLETED || status == InstanceStatus::ABORTED ||
           status == InstanceStatus::FAILED;
}

void to_json(json &j, const StateHistoryEntry &entry) {
    j = json{{"fromState", entry.fromState},
             {"toState", entry.toState},
             {"transition", entry.transition},
             {"timestamp", JsonUtils::formatTimestamp(entry.timestamp)}};
    putString(j, "triggeredBy", entry.triggeredBy);
    if (!entry.data.is_null()) {
        j["data"] = entry.data;
    }
}

void from_json(const json &j, StateHistoryEntry &entry) {
    entry.fromState = j.at("fromState").get<std::string>();
    entry.toState = j.at("toState").get<std::string>();
    entry.transition = j.at("transition").get<std::string>();
    auto timestamp = readTimestamp(j, "timestamp");
    if (!timestamp) {
        throw std::invalid_argument("History entry is missing its timestamp");
    }
    entry.timestamp = *timestamp;
    entry.triggeredBy = readString(j, "triggeredBy");
    entry.data = j.contains("data") ? j.at("data") : json(nullptr);
}

void to_json(json &j, const WorkflowInstance &instance) {
    j = json{{"id", instance.id},
             {"workflowId", instance.workflowId},
             {"version", instance.version},
             {"currentState", instance.currentState},
             {"status", instanceStatusToString(instance.status)},
             {"data", instance.data},
             {"history", instance.history},
             {"createdAt", JsonUtils::formatTimestamp(instance.createdAt)}};
    putTimestamp(j, "startedAt", instance.startedAt);
    putTimestamp(j, "completedAt", instance.completedAt);
    putTimestamp(j, "abortedAt", instance.abortedAt);
    putTimestamp(j, "failedAt", instance.failedAt);
    putString(j, "startedBy", instance.startedBy);
    putString(j, "completedBy", instance.completedBy);
    putString(j, "error", instance.error);
}

void from_json(const json &j, WorkflowInstance &instance) {
    instance.id = j.at("id").get<std::string>();
    instance.workflowId = j.at("workflowId").get<std::string>();
    instance.version = JsonUtils::getString(j, "version");
    instance.currentState = JsonUtils::getString(j, "currentState");

    auto status = instanceStatusFromString(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("Unknown instance status: " + j.at("status").get<std::string>());
    }
    instance.status = *status;

    instance.data = j.contains("data") ? j.at("data") : json::object();
    instance.history = j.contains("history") ? j.at("history").get<std::vector<StateHistoryEntry>>()
                                             : std::vector<StateHistoryEntry>{};

    auto createdAt = readTimestamp(j, "createdAt");
    instance.createdAt = createdAt ? *createdAt : Timestamp{};
    instance.startedAt = readTimestamp(j, "startedAt");
    instance.completedAt = readTimestamp(j, "completedAt");
    instance.abortedAt = readTimestamp(j, "abortedAt");
    instance.failedAt = readTimestamp(j, "failedAt");
    instance.startedBy = readString(j, "startedBy");
    instance.completedBy = readString(j, "completedBy");
    instance.error = readString(j, "error");
}

}  // namespace WCE
