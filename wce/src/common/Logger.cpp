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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace WCE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend creation and replacement
static std::mutex backend_mutex;

LogLevel logLevelFromString(const std::string &name, LogLevel fallback) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) { return std::tolower(c); });

    if (level == "trace") {
        return LogLevel::Trace;
    } else if (level == "debug") {
        return LogLevel::Debug;
    } else if (level == "info") {
        return LogLevel::Info;
    } else if (level == "warn" || level == "warning") {
        return LogLevel::Warn;
    } else if (level == "err" || level == "error") {
        return LogLevel::Error;
    } else if (level == "critical") {
        return LogLevel::Critical;
    } else if (level == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Trace, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Debug, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Info, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Warn, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Error, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    // Skip whitespace and closing parens of e.g. operator() before the argument list
    size_t name_end = paren_pos;
    while (name_end > 0 && (std::isspace(full_name[name_end - 1]) || full_name[name_end - 1] == ')')) {
        name_end--;
    }

    // Last space outside template/argument brackets separates the return type
    size_t name_start = 0;
    int angle_depth = 0;
    int paren_depth = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_depth++;
        } else if (c == '>') {
            angle_depth--;
        } else if (c == '(') {
            paren_depth++;
        } else if (c == ')') {
            paren_depth--;
        } else if (c == ' ' && angle_depth == 0 && paren_depth == 0) {
            name_start = i + 1;
        }
    }

    std::string qualified = full_name.substr(name_start, name_end - name_start);
    while (!qualified.empty() && (std::isspace(qualified[0]) || qualified[0] == '*' || qualified[0] == '&')) {
        qualified.erase(0, 1);
    }

    // Drop template arguments
    std::string result;
    int depth = 0;
    for (char c : qualified) {
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (depth == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(result.back())) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace WCE
