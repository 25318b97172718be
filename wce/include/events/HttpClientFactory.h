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

#include "common/Constants.h"
#include "events/IHttpClient.h"
#include <chrono>
#include <memory>

namespace WCE {

/**
 * @brief Client used by registerHttpRequestHandler when none is supplied
 *
 * A CppHttplibClient identifying itself as "wce/<version>", with certificate
 * verification on and the given fallback for nodes without timeoutMs.
 */
std::unique_ptr<IHttpClient>
createHttpClient(std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(Constants::DEFAULT_HTTP_TIMEOUT_MS));

}  // namespace WCE
