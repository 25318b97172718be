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
#include "model/WorkflowDefinition.h"
#include "model/WorkflowInstance.h"
#include <string>

namespace WCE {

/**
 * @brief Read/write accessor over a key-value working memory
 *
 * Guards, actions and node handlers reach instance data and flow variables
 * only through this object. A non-object backing value is treated as empty
 * and replaced by an object on the first set().
 */
class DataAccessor {
public:
    explicit DataAccessor(json &data) : data_(data) {}

    /**
     * @brief Value stored under key
     * @return The value, or null when the key is absent
     */
    json get(const std::string &key) const;

    /**
     * @brief Value stored under key, or fallback when absent
     */
    json get(const std::string &key, const json &fallback) const;

    void set(const std::string &key, json value);

    bool has(const std::string &key) const;

    /**
     * @brief Remove a key
     * @return true if the key existed
     */
    bool erase(const std::string &key);

    /**
     * @brief Merge every key of an object into the working memory
     */
    void merge(const json &values);

    /**
     * @brief Read-only view of the whole working memory
     */
    const json &all() const {
        return data_;
    }

private:
    json &data_;
};

/**
 * @brief Context passed to guards and actions of the FSM engine
 *
 * Exposes the instance and definition read-only; instance.data is writable
 * through getData/setData or data(). transitionName is empty for contexts
 * created outside a transition (startInstance, abortInstance).
 */
class WorkflowContext {
public:
    WorkflowContext(WorkflowInstance &instance, const WorkflowDefinition &definition, const std::string &currentState,
                    const std::string &transitionName = "", const TransitionConfig *transition = nullptr);

    const WorkflowInstance &getInstance() const {
        return instance_;
    }

    const WorkflowDefinition &getDefinition() const {
        return definition_;
    }

    /**
     * @brief State the hook is attached to (source state for guards, onExit and
     * transition actions; target state for onEnter)
     */
    const std::string &getCurrentState() const {
        return currentState_;
    }

    const std::string &getTransitionName() const {
        return transitionName_;
    }

    /**
     * @brief Transition being executed, or nullptr outside a transition
     */
    const TransitionConfig *getTransition() const {
        return transition_;
    }

    json getData(const std::string &key) const {
        return data_.get(key);
    }

    void setData(const std::string &key, json value) {
        data_.set(key, std::move(value));
    }

    DataAccessor &data() {
        return data_;
    }

private:
    WorkflowInstance &instance_;
    const WorkflowDefinition &definition_;
    std::string currentState_;
    std::string transitionName_;
    const TransitionConfig *transition_;
    DataAccessor data_;
};

}  // namespace WCE
