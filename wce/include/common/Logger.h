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

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace WCE {

/**
 * @brief Process-wide log sink for the engines, parsers and services
 *
 * Every line is prefixed with the calling function, e.g.
 * "WCE::FlowEngine::execute() - Executing flow 'routing' ...". The backend is
 * created lazily as a SpdlogBackend; EngineConfig::applyLogging chooses
 * between console and file output.
 *
 * @code
 * WCE::Logger::setLevel(WCE::LogLevel::Debug);
 * LOG_INFO("Workflow {} registered", definition.id);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the backend, e.g. to capture lines in tests
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    // Both overloads keep an already installed backend
    static void initialize();
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace WCE

// std::format based macros; source_location is captured at the call site
#define LOG_TRACE(...) WCE::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) WCE::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) WCE::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) WCE::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) WCE::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
