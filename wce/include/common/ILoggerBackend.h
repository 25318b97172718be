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

#include <source_location>
#include <string>

namespace WCE {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the engine can implement this interface to route engine
 * diagnostics (missing guards, skipped actions, handler failures) into their
 * own logging system.
 *
 * Example: Custom logger integration
 * @code
 * class AuditLogger : public WCE::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         auditSink->write(level, message, loc.file_name(), loc.line());
 *     }
 *
 *     void setLevel(LogLevel level) override {
 *         auditSink->setMinLevel(level);
 *     }
 *
 *     void flush() override {
 *         auditSink->flush();
 *     }
 * };
 *
 * // In main():
 * WCE::Logger::setBackend(std::make_unique<AuditLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 * @param name Level name, case-insensitive
 * @param fallback Level returned for unknown names
 */
LogLevel logLevelFromString(const std::string &name, LogLevel fallback = LogLevel::Info);

}  // namespace WCE
