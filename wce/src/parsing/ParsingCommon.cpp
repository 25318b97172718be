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

#include "parsing/ParsingCommon.h"
#include "common/JsonUtils.h"

#include <cctype>
#include <fstream>
#include <sstream>

namespace WCE {

std::string ParsingCommon::generateIdFromName(const std::string &name) {
    std::string id;
    bool pendingSeparator = false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            if (pendingSeparator && !id.empty()) {
                id += '_';
            }
            pendingSeparator = false;
            id += static_cast<char>(std::tolower(c));
        } else {
            pendingSeparator = true;
        }
    }
    return id;
}

std::optional<HookReference> ParsingCommon::parseReference(const json &value, std::string *errorOut) {
    if (value.is_string()) {
        std::string name = value.get<std::string>();
        if (name.empty()) {
            if (errorOut) {
                *errorOut = "reference name must not be empty";
            }
            return std::nullopt;
        }
        return HookReference(name);
    }

    if (value.is_object()) {
        std::string type = JsonUtils::getString(value, "type");
        if (type.empty()) {
            if (errorOut) {
                *errorOut = "inline reference must have a non-empty \"type\"";
            }
            return std::nullopt;
        }
        InlineReference inlineRef;
        inlineRef.type = type;
        inlineRef.params = value.contains("params") ? value.at("params") : json(nullptr);
        return HookReference(inlineRef);
    }

    if (errorOut) {
        *errorOut = "reference must be a string or an object with \"type\"";
    }
    return std::nullopt;
}

std::vector<HookReference> ParsingCommon::parseReferenceList(const json &value, const std::string &context,
                                                             std::vector<std::string> &errors) {
    std::vector<HookReference> references;
    if (value.is_null()) {
        return references;
    }

    auto parseOne = [&](const json &item, std::size_t index) {
        std::string error;
        if (auto reference = parseReference(item, &error)) {
            references.push_back(std::move(*reference));
        } else {
            errors.push_back(context + "[" + std::to_string(index) + "]: " + error);
        }
    };

    if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            parseOne(value[i], i);
        }
    } else {
        parseOne(value, 0);
    }
    return references;
}

std::optional<std::string> ParsingCommon::readFile(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string ParsingCommon::readVersion(const json &document, const std::string &fallback) {
    if (!document.is_object() || !document.contains("version")) {
        return fallback;
    }
    const json &version = document.at("version");
    if (version.is_string() && !version.get<std::string>().empty()) {
        return version.get<std::string>();
    }
    if (version.is_number()) {
        return JsonUtils::stringify(version);
    }
    return fallback;
}

}  // namespace WCE
