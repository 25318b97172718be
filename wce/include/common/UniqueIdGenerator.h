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

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace WCE {

/**
 * @brief Thread-safe generator for instance and task identifiers
 *
 * Format: prefix_timestamp_counter_random (e.g. "wf_1729339200123_7_3fa2").
 * The global counter alone guarantees uniqueness within a process; timestamp
 * and random component keep ids distinct across processes sharing a store.
 */
class UniqueIdGenerator {
public:
    /**
     * @brief Generate an id for an FSM workflow instance ("wf_...")
     */
    static std::string generateInstanceId();

    /**
     * @brief Generate an id for a flow graph instance ("flow_...")
     */
    static std::string generateFlowInstanceId();

    /**
     * @brief Generate an id for a human task ("task_...")
     */
    static std::string generateTaskId();

    /**
     * @brief Generate an id with a caller-supplied prefix
     * @param prefix Prefix placed before the first underscore
     */
    static std::string generateUniqueId(const std::string &prefix);

    /**
     * @brief Check whether an id has the generated shape (exactly 3 underscores, non-empty)
     */
    static bool isGeneratedId(const std::string &id);

private:
    static std::string generateBaseId(const std::string &prefix);
    static uint64_t getCurrentTimestamp();
    static uint64_t getRandomComponent();

    static std::atomic<uint64_t> globalCounter_;

    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;
};

}  // namespace WCE
