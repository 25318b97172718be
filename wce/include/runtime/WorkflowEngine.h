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
#include "runtime/WorkflowContext.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace WCE {

/**
 * @brief Guard predicate; params is the inline configuration (null for named references)
 */
using TransitionGuard = std::function<bool(WorkflowContext &context, const json &params)>;

/**
 * @brief Side-effecting hook attached to a state or transition
 */
using TransitionAction = std::function<void(WorkflowContext &context, const json &params)>;

/**
 * @brief Finite state machine engine for named-transition workflows
 *
 * The engine is stateless with respect to instances: every operation takes the
 * instance and its definition, mutates the instance in place and returns it.
 * Callers serialize operations on one instance; separate instances may be
 * processed concurrently. Only the guard/action registries are shared and they
 * are protected by a mutex.
 *
 * Transition order:
 *   guards (AND, first failure stops) -> source onExit -> transition actions
 *   -> currentState + history entry -> target onEnter -> final-state check
 *
 * Missing guards block the transition; missing actions are logged and skipped.
 *
 * Example:
 * @code
 * WorkflowEngine engine;
 * engine.registerGuard("isManager", [](WorkflowContext &ctx, const json &) {
 *     return ctx.getData("role") == "manager";
 * });
 * auto instance = engine.createInstance(definition, {{"role", "manager"}}, "alice");
 * engine.startInstance(instance, definition);
 * engine.executeTransition(instance, definition, "approve", "alice");
 * @endcode
 */
class WorkflowEngine {
public:
    WorkflowEngine() = default;
    ~WorkflowEngine() = default;

    WorkflowEngine(const WorkflowEngine &) = delete;
    WorkflowEngine &operator=(const WorkflowEngine &) = delete;

    /**
     * @brief Register (or replace) a guard under name
     */
    void registerGuard(const std::string &name, TransitionGuard guard);

    /**
     * @brief Register (or replace) an action under name
     */
    void registerAction(const std::string &name, TransitionAction action);

    bool hasGuard(const std::string &name) const;
    bool hasAction(const std::string &name) const;

    /**
     * @brief Create a pending instance positioned at the initial state
     *
     * No hooks run; the only side effect is id generation.
     *
     * @param definition Workflow definition
     * @param data Initial working memory
     * @param startedBy Optional actor id
     */
    WorkflowInstance createInstance(const WorkflowDefinition &definition, json data = json::object(),
                                    const std::optional<std::string> &startedBy = std::nullopt) const;

    /**
     * @brief Start a pending instance
     *
     * Sets running/startedAt, runs the initial state's onEnter actions and
     * completes the instance immediately when the initial state is final.
     *
     * @throws WorkflowError INVALID_LIFECYCLE unless the instance is pending
     * @throws WorkflowError UNKNOWN_STATE if the current state is not defined
     */
    WorkflowInstance &startInstance(WorkflowInstance &instance, const WorkflowDefinition &definition) const;

    /**
     * @brief Execute a named transition from the current state
     *
     * If an action throws, the exception propagates. currentState and history
     * are unchanged when the throw happens in onExit or transition actions and
     * already updated when it happens in the target's onEnter.
     *
     * @param triggeredBy Actor recorded in history and, on completion, completedBy
     * @param data Payload recorded in the history entry (not merged into instance.data)
     * @throws WorkflowError INVALID_LIFECYCLE unless the instance is running
     * @throws WorkflowError UNKNOWN_TRANSITION if the current state lacks the transition
     * @throws WorkflowError GUARD_REJECTED if a guard returns false or is not registered
     * @throws WorkflowError UNKNOWN_STATE if the current or target state is not defined
     */
    WorkflowInstance &executeTransition(WorkflowInstance &instance, const WorkflowDefinition &definition,
                                        const std::string &transitionName,
                                        const std::optional<std::string> &triggeredBy = std::nullopt,
                                        const json &data = nullptr) const;

    /**
     * @brief Abort a running instance
     *
     * Runs the current state's onExit actions, then sets aborted/abortedAt and
     * records abortedBy in completedBy.
     *
     * @throws WorkflowError INVALID_LIFECYCLE unless the instance is running
     */
    WorkflowInstance &abortInstance(WorkflowInstance &instance, const WorkflowDefinition &definition,
                                    const std::optional<std::string> &abortedBy = std::nullopt) const;

    /**
     * @brief Transition names defined on the current state
     * @return Names sorted alphabetically, empty unless the instance is running
     */
    std::vector<std::string> getAvailableTransitions(const WorkflowInstance &instance,
                                                     const WorkflowDefinition &definition) const;

    /**
     * @brief Whether executeTransition would pass its preconditions and guards
     *
     * Guards run against a copy of the instance so their writes are discarded.
     * Never throws; any failure reports false.
     */
    bool canExecuteTransition(const WorkflowInstance &instance, const WorkflowDefinition &definition,
                              const std::string &transitionName) const;

    /**
     * @brief Guard and action names referenced by the definition but not registered
     *
     * Entries are formatted "guard:<name>" or "action:<name>", sorted and unique.
     */
    std::vector<std::string> findUnresolvedReferences(const WorkflowDefinition &definition) const;

private:
    bool checkGuards(const std::vector<GuardReference> &guards, WorkflowContext &context,
                     std::string *failedGuard = nullptr) const;
    void executeActions(const std::vector<ActionReference> &actions, WorkflowContext &context,
                        const char *phase) const;

    std::optional<TransitionGuard> findGuard(const std::string &name) const;
    std::optional<TransitionAction> findAction(const std::string &name) const;

    const StateConfig &requireState(const WorkflowDefinition &definition, const std::string &stateName) const;

    std::unordered_map<std::string, TransitionGuard> guards_;
    std::unordered_map<std::string, TransitionAction> actions_;
    mutable std::mutex registryMutex_;
};

}  // namespace WCE
