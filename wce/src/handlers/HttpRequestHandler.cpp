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

#include "handlers/HttpRequestHandler.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "events/HttpClientFactory.h"

#include <cstdint>
#include <regex>
#include <stdexcept>

namespace WCE {

namespace {

json lookupPath(const json &variables, const std::string &path) {
    const json *current = &variables;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = path.find('.', start);
        std::string segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object() || !current->contains(segment)) {
            return json();
        }
        current = &current->at(segment);
        if (dot == std::string::npos) {
            return *current;
        }
        start = dot + 1;
    }
}

json interpolateBody(const json &body, const json &variables) {
    if (body.is_string()) {
        return HttpRequestHandler::interpolate(body.get<std::string>(), variables);
    }
    if (body.is_object()) {
        json result = json::object();
        for (auto it = body.begin(); it != body.end(); ++it) {
            result[it.key()] = interpolateBody(it.value(), variables);
        }
        return result;
    }
    if (body.is_array()) {
        json result = json::array();
        for (const auto &item : body) {
            result.push_back(interpolateBody(item, variables));
        }
        return result;
    }
    return body;
}

}  // namespace

HttpRequestHandler::HttpRequestHandler(std::shared_ptr<IHttpClient> client) : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("HttpRequestHandler requires an HTTP client");
    }
}

FlowNodeResult HttpRequestHandler::operator()(const FlowNode &node, FlowExecutionContext &context) const {
    HttpClient::Request request = buildRequest(node, context.variables().all());

    LOG_DEBUG("Node '{}' sending {} {}", node.id, request.method, request.url);
    HttpClient::Response response = client_->sendRequest(request).get();

    if (response.statusCode == 0) {
        return FlowNodeResult::failure("HTTP " + request.method + " " + request.url + " failed: " +
                                       (response.error.empty() ? "no response" : response.error));
    }
    if (!response.success) {
        return FlowNodeResult::failure("HTTP " + std::to_string(response.statusCode) + " from " + request.method +
                                       " " + request.url);
    }

    json body = response.body;
    if (!response.body.empty()) {
        if (auto parsed = JsonUtils::parseJson(response.body)) {
            body = std::move(*parsed);
        }
    }

    std::string outputVariable = JsonUtils::getString(node.config, "outputVariable", DEFAULT_OUTPUT_VARIABLE);
    json output = json::object();
    output[outputVariable] = json{{"status", response.statusCode}, {"ok", response.success}, {"body", body}};
    return FlowNodeResult::ok(std::move(output));
}

HttpClient::Request HttpRequestHandler::buildRequest(const FlowNode &node, const json &variables) {
    std::string url = JsonUtils::getString(node.config, "url");
    if (url.empty()) {
        throw std::invalid_argument("http_request node '" + node.id + "' has no url");
    }

    HttpClient::Request request;
    request.method = JsonUtils::getString(node.config, "method", "GET");
    request.url = interpolate(url, variables);
    request.contentType = JsonUtils::getString(node.config, "contentType", "application/json");

    if (node.config.contains("headers") && node.config.at("headers").is_object()) {
        for (const auto &[key, value] : node.config.at("headers").items()) {
            request.headers[key] = interpolate(JsonUtils::stringify(value), variables);
        }
    }

    if (JsonUtils::hasKey(node.config, "body")) {
        json body = interpolateBody(node.config.at("body"), variables);
        request.body = body.is_string() ? body.get<std::string>() : JsonUtils::toCompactString(body);
    }

    // Non-positive or non-integral values fall back to the client default
    if (node.config.contains("timeoutMs")) {
        const json &timeout = node.config.at("timeoutMs");
        if (timeout.is_number_integer() && timeout.get<std::int64_t>() > 0) {
            request.timeout = std::chrono::milliseconds(timeout.get<std::int64_t>());
        } else {
            LOG_WARN("http_request node '{}' ignores invalid timeoutMs {}", node.id, timeout.dump());
        }
    }

    return request;
}

std::string HttpRequestHandler::interpolate(const std::string &text, const json &variables) {
    static const std::regex placeholder(R"(\{\{\s*([^}\s]+)\s*\}\})");

    std::string result;
    auto begin = std::sregex_iterator(text.begin(), text.end(), placeholder);
    auto end = std::sregex_iterator();
    std::size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch &match = *it;
        result.append(text, last, static_cast<std::size_t>(match.position(0)) - last);
        json value = lookupPath(variables, match[1].str());
        result += value.is_null() ? match[0].str() : JsonUtils::stringify(value);
        last = static_cast<std::size_t>(match.position(0) + match.length(0));
    }
    result.append(text, last, std::string::npos);
    return result;
}

void registerHttpRequestHandler(FlowEngine &engine, std::shared_ptr<IHttpClient> client) {
    if (!client) {
        client = std::shared_ptr<IHttpClient>(createHttpClient());
    }
    engine.registerHandler(Constants::NODE_HTTP_REQUEST, HttpRequestHandler(std::move(client)));
}

}  // namespace WCE
