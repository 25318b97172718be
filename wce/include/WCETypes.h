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

#include <chrono>
#include <nlohmann/json.hpp>

namespace WCE {

/**
 * @brief Dynamic value type for workflow working memory
 *
 * Used for instance data, flow variables, node configuration, guard/action
 * parameters and task payloads.
 */
using json = nlohmann::json;

/**
 * @brief Wall-clock point used for every lifecycle timestamp
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Current wall-clock time
 */
inline Timestamp now() {
    return std::chrono::system_clock::now();
}

}  // namespace WCE
