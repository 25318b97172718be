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

#include "common/UniqueIdGenerator.h"
#include "common/Constants.h"
#include "common/Logger.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace WCE {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateInstanceId() {
    return generateBaseId(Constants::WORKFLOW_INSTANCE_ID_PREFIX);
}

std::string UniqueIdGenerator::generateFlowInstanceId() {
    return generateBaseId(Constants::FLOW_INSTANCE_ID_PREFIX);
}

std::string UniqueIdGenerator::generateTaskId() {
    return generateBaseId(Constants::TASK_ID_PREFIX);
}

std::string UniqueIdGenerator::generateUniqueId(const std::string &prefix) {
    return generateBaseId(prefix);
}

bool UniqueIdGenerator::isGeneratedId(const std::string &id) {
    if (id.empty()) {
        return false;
    }

    size_t underscoreCount = 0;
    for (char c : id) {
        if (c == '_') {
            underscoreCount++;
        }
    }

    // prefix_timestamp_counter_random
    return underscoreCount == 3;
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix) {
    uint64_t globalCount = globalCounter_.fetch_add(1);
    uint64_t timestamp = getCurrentTimestamp();
    uint64_t randomComponent = getRandomComponent();

    std::ostringstream oss;
    oss << prefix << "_" << timestamp << "_" << globalCount << "_" << std::hex << randomComponent;

    std::string id = oss.str();
    LOG_TRACE("UniqueIdGenerator: Generated ID: {}", id);

    return id;
}

uint64_t UniqueIdGenerator::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

uint64_t UniqueIdGenerator::getRandomComponent() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    // Lower 16 bits keep ids short
    return rng_() & 0xFFFF;
}

}  // namespace WCE
