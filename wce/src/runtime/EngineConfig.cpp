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

#include "runtime/EngineConfig.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace WCE {

EngineConfig EngineConfig::fromJson(const json &document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Engine configuration must be a JSON object");
    }

    EngineConfig config;

    if (document.contains("maxFlowNodes")) {
        const json &value = document.at("maxFlowNodes");
        if (!value.is_number_unsigned() || value.get<std::size_t>() == 0) {
            throw std::invalid_argument("maxFlowNodes must be a positive integer");
        }
        config.maxFlowNodes = value.get<std::size_t>();
    }

    if (document.contains("requiredHandlerTypes")) {
        const json &value = document.at("requiredHandlerTypes");
        if (!value.is_array()) {
            throw std::invalid_argument("requiredHandlerTypes must be an array of node type names");
        }
        for (const auto &type : value) {
            if (!type.is_string()) {
                throw std::invalid_argument("requiredHandlerTypes must be an array of node type names");
            }
            config.requiredHandlerTypes.push_back(type.get<std::string>());
        }
    }

    if (document.contains("logLevel")) {
        if (!document.at("logLevel").is_string()) {
            throw std::invalid_argument("logLevel must be a string");
        }
        config.logLevel = logLevelFromString(document.at("logLevel").get<std::string>(), config.logLevel);
    }

    config.logDir = JsonUtils::getString(document, "logDir");
    config.logToFile = JsonUtils::getBool(document, "logToFile", !config.logDir.empty());

    return config;
}

EngineConfig EngineConfig::fromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    auto document = JsonUtils::parseJson(buffer.str(), &error);
    if (!document) {
        throw std::runtime_error("Invalid configuration file " + path + ": " + error);
    }

    try {
        return fromJson(*document);
    } catch (const std::invalid_argument &e) {
        throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
    }
}

void EngineConfig::applyEnvironment() {
    if (const char *maxNodes = std::getenv(Constants::ENV_MAX_FLOW_NODES)) {
        auto value = JsonUtils::parseNumber(maxNodes);
        // max() rounds up to 2^N as a double, so the bound is exclusive
        constexpr double upperBound = static_cast<double>(std::numeric_limits<std::size_t>::max());
        if (value && *value >= 1 && *value < upperBound && std::floor(*value) == *value) {
            maxFlowNodes = static_cast<std::size_t>(*value);
        } else {
            LOG_WARN("Ignoring invalid {}='{}'", Constants::ENV_MAX_FLOW_NODES, maxNodes);
        }
    }

    if (const char *level = std::getenv(Constants::ENV_LOG_LEVEL)) {
        logLevel = logLevelFromString(level, logLevel);
    }
}

void EngineConfig::applyLogging() const {
    if (logToFile && !logDir.empty()) {
        Logger::initialize(logDir, true);
    } else {
        Logger::initialize();
    }
    Logger::setLevel(logLevel);
}

bool EngineConfig::isHandlerRequired(const std::string &nodeType) const {
    return std::find(requiredHandlerTypes.begin(), requiredHandlerTypes.end(), nodeType) !=
           requiredHandlerTypes.end();
}

}  // namespace WCE
