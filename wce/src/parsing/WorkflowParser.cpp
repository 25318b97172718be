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

#include "parsing/WorkflowParser.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "parsing/ParsingCommon.h"

#include <algorithm>

namespace WCE {

namespace {

// on_enter/on_exit are the documented keys; the camelCase spelling is accepted too
const json &firstPresent(const json &object, const char *primary, const char *alternate) {
    static const json null;
    if (object.contains(primary)) {
        return object.at(primary);
    }
    if (object.contains(alternate)) {
        return object.at(alternate);
    }
    return null;
}

}  // namespace

std::shared_ptr<WorkflowDefinition> WorkflowParser::parseFile(const std::string &filename, const std::string &id) {
    initParsing();

    auto content = ParsingCommon::readFile(filename);
    if (!content) {
        addError("File not found: " + filename);
        return nullptr;
    }

    LOG_INFO("Parsing workflow file: {}", filename);
    return parseContent(*content, id);
}

std::shared_ptr<WorkflowDefinition> WorkflowParser::parseContent(const std::string &content, const std::string &id) {
    initParsing();

    std::string parseError;
    auto document = JsonUtils::parseJson(content, &parseError);
    if (!document) {
        addError("Invalid workflow definition: " + parseError);
        return nullptr;
    }
    return parseDocument(*document, id);
}

std::shared_ptr<WorkflowDefinition> WorkflowParser::parseDocument(const json &document, const std::string &id) {
    initParsing();

    if (!document.is_object()) {
        addError("Invalid workflow definition: document must be an object");
        return nullptr;
    }

    auto definition = std::make_shared<WorkflowDefinition>();
    definition->name = JsonUtils::getString(document, "name");
    if (definition->name.empty()) {
        addError("Workflow definition must have a name");
    }

    if (!id.empty()) {
        definition->id = id;
    } else {
        definition->id = JsonUtils::getString(document, "id");
        if (definition->id.empty()) {
            definition->id = ParsingCommon::generateIdFromName(definition->name);
        }
    }

    definition->description = JsonUtils::getString(document, "description");
    definition->version = ParsingCommon::readVersion(document, Constants::DEFAULT_DEFINITION_VERSION);
    definition->metadata = document.contains("metadata") ? document.at("metadata") : json(nullptr);

    if (document.contains("type")) {
        std::string typeName = JsonUtils::getString(document, "type");
        if (auto type = workflowTypeFromString(typeName)) {
            definition->type = *type;
        } else {
            addWarning("Unknown workflow type '" + typeName + "', using sequential");
        }
    }

    const json statesJson = document.contains("states") ? document.at("states") : json(nullptr);
    if (!statesJson.is_object() || statesJson.empty()) {
        addError("Workflow definition must have at least one state");
        return nullptr;
    }

    std::vector<std::string> initialStates;
    for (auto it = statesJson.begin(); it != statesJson.end(); ++it) {
        StateConfig state;
        if (!parseState(it.key(), it.value(), state)) {
            continue;
        }
        if (state.initial) {
            initialStates.push_back(state.name);
        }
        definition->states.emplace(state.name, std::move(state));
    }

    if (initialStates.empty()) {
        addError("Workflow definition must have an initial state");
    } else {
        definition->initialState = initialStates.front();
        if (initialStates.size() > 1) {
            std::string names;
            for (const auto &name : initialStates) {
                names += (names.empty() ? "" : ", ") + name;
            }
            addError("Workflow definition must have exactly one initial state, found: " + names);
        }
    }

    // Structural checks not already reported above
    for (const auto &message : validateWorkflowDefinition(*definition)) {
        if (std::find(errorMessages_.begin(), errorMessages_.end(), message) == errorMessages_.end() &&
            message != "Workflow must have a name" && message != "Workflow must have an ID" &&
            message != "Workflow must have an initial state") {
            addError(message);
        }
    }

    if (hasErrors()) {
        return nullptr;
    }

    LOG_DEBUG("Parsed {} workflow '{}' ({} v{}) with {} states", workflowTypeToString(definition->type),
              definition->name, definition->id, definition->version, definition->states.size());
    return definition;
}

bool WorkflowParser::hasErrors() const {
    return !errorMessages_.empty();
}

const std::vector<std::string> &WorkflowParser::getErrorMessages() const {
    return errorMessages_;
}

const std::vector<std::string> &WorkflowParser::getWarningMessages() const {
    return warningMessages_;
}

std::vector<std::string> WorkflowParser::validateWorkflowDefinition(const WorkflowDefinition &definition) {
    std::vector<std::string> errors;

    if (definition.id.empty()) {
        errors.push_back("Workflow must have an ID");
    }
    if (definition.name.empty()) {
        errors.push_back("Workflow must have a name");
    }
    if (definition.version.empty()) {
        errors.push_back("Workflow must have a version");
    }
    if (definition.states.empty()) {
        errors.push_back("Workflow must have at least one state");
    }

    if (definition.initialState.empty()) {
        errors.push_back("Workflow must have an initial state");
    } else if (!definition.findState(definition.initialState)) {
        errors.push_back("Initial state \"" + definition.initialState + "\" does not exist");
    }

    bool hasFinalState = std::any_of(definition.states.begin(), definition.states.end(),
                                     [](const auto &entry) { return entry.second.final; });
    if (!definition.states.empty() && !hasFinalState) {
        errors.push_back("Workflow must have at least one final state");
    }

    for (const auto &[stateName, state] : definition.states) {
        for (const auto &[transitionName, transition] : state.transitions) {
            if (!definition.findState(transition.target)) {
                errors.push_back("Invalid transition \"" + transitionName + "\" in state \"" + stateName +
                                 "\": target state \"" + transition.target + "\" does not exist");
            }
        }
    }

    return errors;
}

void WorkflowParser::initParsing() {
    errorMessages_.clear();
    warningMessages_.clear();
}

void WorkflowParser::addError(const std::string &message) {
    LOG_ERROR("WorkflowParser - {}", message);
    errorMessages_.push_back(message);
}

void WorkflowParser::addWarning(const std::string &message) {
    LOG_WARN("WorkflowParser - {}", message);
    warningMessages_.push_back(message);
}

bool WorkflowParser::parseState(const std::string &stateName, const json &stateJson, StateConfig &state) {
    state.name = stateName;

    if (stateJson.is_null()) {
        // "done": null declares a plain state
        return true;
    }
    if (!stateJson.is_object()) {
        addError("State \"" + stateName + "\" must be an object");
        return false;
    }

    state.initial = JsonUtils::getBool(stateJson, "initial");
    state.final = JsonUtils::getBool(stateJson, "final");
    state.metadata = stateJson.contains("metadata") ? stateJson.at("metadata") : json(nullptr);

    std::vector<std::string> referenceErrors;
    state.onEnter = ParsingCommon::parseReferenceList(firstPresent(stateJson, "on_enter", "onEnter"),
                                                      "State \"" + stateName + "\" on_enter", referenceErrors);
    state.onExit = ParsingCommon::parseReferenceList(firstPresent(stateJson, "on_exit", "onExit"),
                                                     "State \"" + stateName + "\" on_exit", referenceErrors);
    for (const auto &error : referenceErrors) {
        addError(error);
    }

    if (!stateJson.contains("transitions") || stateJson.at("transitions").is_null()) {
        return true;
    }

    const json &transitionsJson = stateJson.at("transitions");
    if (!transitionsJson.is_object()) {
        addError("Transitions of state \"" + stateName + "\" must be an object");
        return true;
    }

    for (auto it = transitionsJson.begin(); it != transitionsJson.end(); ++it) {
        TransitionConfig transition;
        if (parseTransition(stateName, it.key(), it.value(), transition)) {
            state.transitions.emplace(it.key(), std::move(transition));
        }
    }

    if (state.final && !state.transitions.empty()) {
        addWarning("Final state \"" + stateName + "\" declares transitions that can never fire");
    }
    return true;
}

bool WorkflowParser::parseTransition(const std::string &stateName, const std::string &transitionName,
                                     const json &value, TransitionConfig &transition) {
    // Shorthand: "submit": "review"
    if (value.is_string()) {
        transition.target = value.get<std::string>();
        if (transition.target.empty()) {
            addError("Transition \"" + transitionName + "\" in state \"" + stateName + "\" must have a target state");
            return false;
        }
        return true;
    }

    if (!value.is_object()) {
        addError("Transition \"" + transitionName + "\" in state \"" + stateName +
                 "\" must be a target name or an object");
        return false;
    }

    transition.target = JsonUtils::getString(value, "target");
    if (transition.target.empty()) {
        addError("Transition \"" + transitionName + "\" in state \"" + stateName + "\" must have a target state");
        return false;
    }

    std::string context = "Transition \"" + transitionName + "\" in state \"" + stateName + "\"";
    std::vector<std::string> referenceErrors;
    transition.guards =
        ParsingCommon::parseReferenceList(value.contains("guards") ? value.at("guards") : json(nullptr),
                                          context + " guards", referenceErrors);
    transition.actions =
        ParsingCommon::parseReferenceList(value.contains("actions") ? value.at("actions") : json(nullptr),
                                          context + " actions", referenceErrors);
    for (const auto &error : referenceErrors) {
        addError(error);
    }

    transition.metadata = value.contains("metadata") ? value.at("metadata") : json(nullptr);
    return true;
}

}  // namespace WCE
