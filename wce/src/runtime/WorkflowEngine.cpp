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

#include "runtime/WorkflowEngine.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "common/WorkflowError.h"

#include <algorithm>
#include <set>

namespace WCE {

void WorkflowEngine::registerGuard(const std::string &name, TransitionGuard guard) {
    if (name.empty()) {
        throw std::invalid_argument("Guard name must not be empty");
    }
    std::lock_guard<std::mutex> lock(registryMutex_);
    guards_[name] = std::move(guard);
    LOG_DEBUG("Registered guard '{}'", name);
}

void WorkflowEngine::registerAction(const std::string &name, TransitionAction action) {
    if (name.empty()) {
        throw std::invalid_argument("Action name must not be empty");
    }
    std::lock_guard<std::mutex> lock(registryMutex_);
    actions_[name] = std::move(action);
    LOG_DEBUG("Registered action '{}'", name);
}

bool WorkflowEngine::hasGuard(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return guards_.find(name) != guards_.end();
}

bool WorkflowEngine::hasAction(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return actions_.find(name) != actions_.end();
}

WorkflowInstance WorkflowEngine::createInstance(const WorkflowDefinition &definition, json data,
                                                const std::optional<std::string> &startedBy) const {
    WorkflowInstance instance;
    instance.id = UniqueIdGenerator::generateInstanceId();
    instance.workflowId = definition.id;
    instance.version = definition.version;
    instance.currentState = definition.initialState;
    instance.status = InstanceStatus::PENDING;
    instance.data = data.is_object() ? std::move(data) : json::object();
    instance.createdAt = now();
    instance.startedBy = startedBy;

    LOG_DEBUG("Created instance {} of workflow {} v{}", instance.id, definition.id,
              definition.version);
    return instance;
}

WorkflowInstance &WorkflowEngine::startInstance(WorkflowInstance &instance, const WorkflowDefinition &definition) const {
    if (instance.status != InstanceStatus::PENDING) {
        throw WorkflowError(ErrorCode::INVALID_LIFECYCLE, std::string("Cannot start workflow in status: ") +
                                                              instanceStatusToString(instance.status));
    }

    const StateConfig &initialState = requireState(definition, instance.currentState);

    instance.status = InstanceStatus::RUNNING;
    instance.startedAt = now();
    LOG_INFO("Instance {} started in state '{}'", instance.id, instance.currentState);

    WorkflowContext context(instance, definition, instance.currentState);
    executeActions(initialState.onEnter, context, "onEnter");

    // A workflow may start and finish in one state
    if (initialState.final) {
        instance.status = InstanceStatus::COMPLETED;
        instance.completedAt = now();
        LOG_INFO("Instance {} completed in initial state '{}'", instance.id, instance.currentState);
    }

    return instance;
}

WorkflowInstance &WorkflowEngine::executeTransition(WorkflowInstance &instance, const WorkflowDefinition &definition,
                                                    const std::string &transitionName,
                                                    const std::optional<std::string> &triggeredBy,
                                                    const json &data) const {
    if (instance.status != InstanceStatus::RUNNING) {
        throw WorkflowError(ErrorCode::INVALID_LIFECYCLE,
                            std::string("Cannot execute transition on workflow in status: ") +
                                instanceStatusToString(instance.status));
    }

    const StateConfig &currentState = requireState(definition, instance.currentState);
    const TransitionConfig *transition = currentState.findTransition(transitionName);
    if (!transition) {
        throw WorkflowError(ErrorCode::UNKNOWN_TRANSITION, "Transition \"" + transitionName +
                                                               "\" not available in state \"" +
                                                               instance.currentState + "\"");
    }
    const StateConfig &targetState = requireState(definition, transition->target);

    const std::string fromState = instance.currentState;
    WorkflowContext context(instance, definition, fromState, transitionName, transition);

    std::string failedGuard;
    if (!checkGuards(transition->guards, context, &failedGuard)) {
        LOG_INFO("Transition '{}' of instance {} blocked by guard '{}'", transitionName, instance.id,
                 failedGuard);
        throw WorkflowError(ErrorCode::GUARD_REJECTED, "Transition \"" + transitionName +
                                                           "\" blocked by guard \"" + failedGuard + "\"");
    }

    executeActions(currentState.onExit, context, "onExit");
    executeActions(transition->actions, context, "transition");

    instance.currentState = transition->target;

    StateHistoryEntry entry;
    entry.fromState = fromState;
    entry.toState = transition->target;
    entry.transition = transitionName;
    entry.timestamp = now();
    entry.triggeredBy = triggeredBy;
    entry.data = data;
    instance.history.push_back(std::move(entry));

    LOG_DEBUG("Instance {} '{}' --{}--> '{}'", instance.id, fromState, transitionName,
              transition->target);

    WorkflowContext enterContext(instance, definition, transition->target, transitionName, transition);
    executeActions(targetState.onEnter, enterContext, "onEnter");

    if (targetState.final) {
        instance.status = InstanceStatus::COMPLETED;
        instance.completedAt = now();
        instance.completedBy = triggeredBy;
        LOG_INFO("Instance {} completed in state '{}'", instance.id, instance.currentState);
    }

    return instance;
}

WorkflowInstance &WorkflowEngine::abortInstance(WorkflowInstance &instance, const WorkflowDefinition &definition,
                                                const std::optional<std::string> &abortedBy) const {
    if (instance.status != InstanceStatus::RUNNING) {
        throw WorkflowError(ErrorCode::INVALID_LIFECYCLE, std::string("Cannot abort workflow in status: ") +
                                                              instanceStatusToString(instance.status));
    }

    if (const StateConfig *currentState = definition.findState(instance.currentState)) {
        WorkflowContext context(instance, definition, instance.currentState);
        executeActions(currentState->onExit, context, "onExit");
    } else {
        LOG_WARN("Aborting instance {} in unknown state '{}', no onExit actions run", instance.id,
                 instance.currentState);
    }

    instance.status = InstanceStatus::ABORTED;
    instance.abortedAt = now();
    instance.completedBy = abortedBy;
    LOG_INFO("Instance {} aborted in state '{}'", instance.id, instance.currentState);

    return instance;
}

std::vector<std::string> WorkflowEngine::getAvailableTransitions(const WorkflowInstance &instance,
                                                                 const WorkflowDefinition &definition) const {
    std::vector<std::string> names;
    if (instance.status != InstanceStatus::RUNNING) {
        return names;
    }

    const StateConfig *state = definition.findState(instance.currentState);
    if (!state) {
        return names;
    }

    names.reserve(state->transitions.size());
    for (const auto &[name, transition] : state->transitions) {
        names.push_back(name);
    }
    return names;
}

bool WorkflowEngine::canExecuteTransition(const WorkflowInstance &instance, const WorkflowDefinition &definition,
                                          const std::string &transitionName) const {
    if (instance.status != InstanceStatus::RUNNING) {
        return false;
    }

    const StateConfig *state = definition.findState(instance.currentState);
    if (!state) {
        return false;
    }

    const TransitionConfig *transition = state->findTransition(transitionName);
    if (!transition || !definition.findState(transition->target)) {
        return false;
    }

    if (transition->guards.empty()) {
        return true;
    }

    // Guards see a scratch copy; writes they make are discarded
    WorkflowInstance scratch = instance;
    WorkflowContext context(scratch, definition, scratch.currentState, transitionName, transition);
    try {
        return checkGuards(transition->guards, context);
    } catch (const std::exception &e) {
        LOG_WARN("Guard evaluation for '{}' threw: {}", transitionName, e.what());
        return false;
    }
}

std::vector<std::string> WorkflowEngine::findUnresolvedReferences(const WorkflowDefinition &definition) const {
    std::set<std::string> unresolved;

    auto collectActions = [&](const std::vector<ActionReference> &actions) {
        for (const auto &reference : actions) {
            if (!hasAction(referenceName(reference))) {
                unresolved.insert("action:" + referenceName(reference));
            }
        }
    };

    for (const auto &[stateName, state] : definition.states) {
        collectActions(state.onEnter);
        collectActions(state.onExit);
        for (const auto &[transitionName, transition] : state.transitions) {
            for (const auto &reference : transition.guards) {
                if (!hasGuard(referenceName(reference))) {
                    unresolved.insert("guard:" + referenceName(reference));
                }
            }
            collectActions(transition.actions);
        }
    }

    return std::vector<std::string>(unresolved.begin(), unresolved.end());
}

bool WorkflowEngine::checkGuards(const std::vector<GuardReference> &guards, WorkflowContext &context,
                                 std::string *failedGuard) const {
    for (const auto &reference : guards) {
        const std::string &name = referenceName(reference);
        auto guard = findGuard(name);
        if (!guard) {
            // Fail closed: an unresolvable guard blocks the transition
            LOG_WARN("Guard '{}' not found, blocking transition '{}'", name,
                     context.getTransitionName());
            if (failedGuard) {
                *failedGuard = name;
            }
            return false;
        }

        if (!(*guard)(context, referenceParams(reference))) {
            if (failedGuard) {
                *failedGuard = name;
            }
            return false;
        }
    }
    return true;
}

void WorkflowEngine::executeActions(const std::vector<ActionReference> &actions, WorkflowContext &context,
                                    const char *phase) const {
    for (const auto &reference : actions) {
        const std::string &name = referenceName(reference);
        auto action = findAction(name);
        if (!action) {
            LOG_WARN("Action '{}' not found, skipping ({} of state '{}')", name, phase,
                     context.getCurrentState());
            continue;
        }

        try {
            (*action)(context, referenceParams(reference));
        } catch (const std::exception &e) {
            LOG_ERROR("Action '{}' failed during {} of state '{}': {}", name, phase,
                      context.getCurrentState(), e.what());
            throw;
        }
    }
}

std::optional<TransitionGuard> WorkflowEngine::findGuard(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = guards_.find(name);
    if (it == guards_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransitionAction> WorkflowEngine::findAction(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = actions_.find(name);
    if (it == actions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const StateConfig &WorkflowEngine::requireState(const WorkflowDefinition &definition,
                                                const std::string &stateName) const {
    const StateConfig *state = definition.findState(stateName);
    if (!state) {
        throw WorkflowError(ErrorCode::UNKNOWN_STATE,
                            "State \"" + stateName + "\" does not exist in workflow \"" + definition.id + "\"");
    }
    return *state;
}

}  // namespace WCE
