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

#include <cstddef>

/**
 * @file Constants.h
 * @brief Global constants for workflow definitions and engine defaults
 */

namespace WCE::Constants {

// ============================================================================
// Flow node types
// ============================================================================

constexpr const char *NODE_START = "start";
constexpr const char *NODE_END = "end";
constexpr const char *NODE_DECISION = "decision";
constexpr const char *NODE_ASSIGNMENT = "assignment";
constexpr const char *NODE_LOOP = "loop";
constexpr const char *NODE_CREATE_RECORD = "create_record";
constexpr const char *NODE_UPDATE_RECORD = "update_record";
constexpr const char *NODE_DELETE_RECORD = "delete_record";
constexpr const char *NODE_GET_RECORD = "get_record";
constexpr const char *NODE_HTTP_REQUEST = "http_request";
constexpr const char *NODE_SCRIPT = "script";
constexpr const char *NODE_WAIT = "wait";
constexpr const char *NODE_SUBFLOW = "subflow";
constexpr const char *NODE_CONNECTOR_ACTION = "connector_action";

// ============================================================================
// Engine defaults
// ============================================================================

constexpr const char *ENGINE_VERSION = "1.0.0";

/**
 * @brief Default bound on nodes visited by a single FlowEngine::execute call
 *
 * Trips on cycles without an exit condition.
 */
constexpr std::size_t DEFAULT_MAX_FLOW_NODES = 500;

/**
 * @brief Version assigned to definitions that do not declare one
 */
constexpr const char *DEFAULT_DEFINITION_VERSION = "1.0.0";

/**
 * @brief Timeout for http_request nodes that do not set timeoutMs
 */
constexpr long long DEFAULT_HTTP_TIMEOUT_MS = 5000;

// ============================================================================
// Generated id prefixes
// ============================================================================

constexpr const char *WORKFLOW_INSTANCE_ID_PREFIX = "wf";
constexpr const char *FLOW_INSTANCE_ID_PREFIX = "flow";
constexpr const char *TASK_ID_PREFIX = "task";

// ============================================================================
// Environment variables
// ============================================================================

constexpr const char *ENV_MAX_FLOW_NODES = "WCE_MAX_FLOW_NODES";
constexpr const char *ENV_LOG_LEVEL = "SPDLOG_LEVEL";

}  // namespace WCE::Constants
