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

#include "WCETypes.h"
#include "events/IHttpClient.h"
#include "runtime/FlowEngine.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace WCE {

/**
 * @brief Node handler for http_request nodes
 *
 * Node config:
 * @code
 * {
 *   "method": "POST",                          // default GET
 *   "url": "https://api.example.com/orders/{{orderId}}",
 *   "headers": { "X-Token": "{{token}}" },
 *   "body": { "amount": "{{amount}}" },        // object -> JSON, string sent as-is
 *   "contentType": "application/json",
 *   "outputVariable": "orderResponse",         // default "httpResponse"
 *   "timeoutMs": 3000                          // this request only; default is the client's
 * }
 * @endcode
 *
 * {{path}} placeholders in url, header values and string body values are
 * replaced with flow variables; unresolved placeholders are left as written.
 * On a 2xx response the handler outputs
 * {<outputVariable>: {status, ok, body}} with body parsed as JSON when
 * possible. Non-2xx responses and transport errors fail the node.
 */
class HttpRequestHandler {
public:
    static constexpr const char *DEFAULT_OUTPUT_VARIABLE = "httpResponse";

    explicit HttpRequestHandler(std::shared_ptr<IHttpClient> client);

    FlowNodeResult operator()(const FlowNode &node, FlowExecutionContext &context) const;

    /**
     * @brief Build the request for a node against the current variables
     * @throws std::invalid_argument if the node has no url
     */
    static HttpClient::Request buildRequest(const FlowNode &node, const json &variables);

    /**
     * @brief Replace {{path}} placeholders with variable values
     */
    static std::string interpolate(const std::string &text, const json &variables);

private:
    std::shared_ptr<IHttpClient> client_;
};

/**
 * @brief Register an HttpRequestHandler for the http_request node type
 * @param client HTTP client; createHttpClient() when null
 */
void registerHttpRequestHandler(FlowEngine &engine, std::shared_ptr<IHttpClient> client = nullptr);

}  // namespace WCE
