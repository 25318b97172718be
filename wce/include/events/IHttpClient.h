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

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace WCE {

// HttpClient: outgoing requests issued by http_request nodes
namespace HttpClient {

/**
 * @brief Outgoing HTTP request
 */
struct Request {
    std::string method;                          // "GET", "POST", "PUT", "PATCH", "DELETE"
    std::string url;                             // Full URL: "http://example.com:8080/api/test"
    std::string body;                            // Request payload
    std::string contentType;                     // "application/json", ...
    std::map<std::string, std::string> headers;  // Custom HTTP headers
    std::optional<std::chrono::milliseconds> timeout;  // Overrides the client default for this request only
};

/**
 * @brief Response to an outgoing request
 */
struct Response {
    bool success = false;                        // true if HTTP 200-299 and no network error
    int statusCode = 0;                          // HTTP status code (0 if network error)
    std::string body;                            // Response payload
    std::map<std::string, std::string> headers;  // Response headers
    std::string error;                           // Transport error description (empty on HTTP response)
};

}  // namespace HttpClient

/**
 * @brief HTTP client interface used by the http_request node handler
 *
 * Tests substitute a mock; production uses CppHttplibClient.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Send HTTP request asynchronously
     *
     * @param request HTTP request data
     * @return Future with HTTP response
     */
    virtual std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) = 0;

    /**
     * @brief Set the default timeout for requests that carry none
     *
     * @param timeout Maximum wait time for HTTP response
     */
    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;
};

}  // namespace WCE
