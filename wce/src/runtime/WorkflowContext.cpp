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

#include "runtime/WorkflowContext.h"

namespace WCE {

json DataAccessor::get(const std::string &key) const {
    return get(key, nullptr);
}

json DataAccessor::get(const std::string &key, const json &fallback) const {
    if (!data_.is_object()) {
        return fallback;
    }
    auto it = data_.find(key);
    return it != data_.end() ? *it : fallback;
}

void DataAccessor::set(const std::string &key, json value) {
    if (!data_.is_object()) {
        data_ = json::object();
    }
    data_[key] = std::move(value);
}

bool DataAccessor::has(const std::string &key) const {
    return data_.is_object() && data_.contains(key);
}

bool DataAccessor::erase(const std::string &key) {
    if (!data_.is_object()) {
        return false;
    }
    return data_.erase(key) > 0;
}

void DataAccessor::merge(const json &values) {
    if (!values.is_object()) {
        return;
    }
    for (auto it = values.begin(); it != values.end(); ++it) {
        set(it.key(), it.value());
    }
}

WorkflowContext::WorkflowContext(WorkflowInstance &instance, const WorkflowDefinition &definition,
                                 const std::string &currentState, const std::string &transitionName,
                                 const TransitionConfig *transition)
    : instance_(instance), definition_(definition), currentState_(currentState), transitionName_(transitionName),
      transition_(transition), data_(instance.data) {}

}  // namespace WCE
