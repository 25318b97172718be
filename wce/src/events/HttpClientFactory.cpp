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

#include "events/HttpClientFactory.h"
#include "events/CppHttplibClient.h"
#include <string>

namespace WCE {

std::unique_ptr<IHttpClient> createHttpClient(std::chrono::milliseconds defaultTimeout) {
    auto client = std::make_unique<CppHttplibClient>();
    client->setTimeout(defaultTimeout);
    client->setSSLVerification(true);
    client->setCustomHeaders({{"User-Agent", std::string("wce/") + Constants::ENGINE_VERSION}});
    return client;
}

}  // namespace WCE
