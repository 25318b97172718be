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
#include "common/Constants.h"
#include "common/ILoggerBackend.h"
#include <cstddef>
#include <string>
#include <vector>

namespace WCE {

/**
 * @brief Engine configuration
 *
 * JSON form (every key optional):
 * @code
 * {
 *   "maxFlowNodes": 500,
 *   "requiredHandlerTypes": ["http_request", "create_record"],
 *   "logLevel": "info",
 *   "logDir": "/var/log/wce",
 *   "logToFile": false
 * }
 * @endcode
 *
 * Environment overlay: WCE_MAX_FLOW_NODES, SPDLOG_LEVEL.
 */
struct EngineConfig {
    std::size_t maxFlowNodes = Constants::DEFAULT_MAX_FLOW_NODES;

    /**
     * @brief Node types that must have a registered handler
     *
     * Executing a node of a listed type without a handler fails the flow with
     * HANDLER_FAILURE instead of running as a no-op.
     */
    std::vector<std::string> requiredHandlerTypes;

    LogLevel logLevel = LogLevel::Info;
    std::string logDir;
    bool logToFile = false;

    /**
     * @brief Build a configuration from a JSON object
     * @throws std::invalid_argument on wrongly typed values
     */
    static EngineConfig fromJson(const json &document);

    /**
     * @brief Load a configuration file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig fromFile(const std::string &path);

    /**
     * @brief Overlay values from environment variables
     */
    void applyEnvironment();

    /**
     * @brief Initialize the global logger from logDir/logToFile/logLevel
     */
    void applyLogging() const;

    bool isHandlerRequired(const std::string &nodeType) const;
};

}  // namespace WCE
