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

#include "events/CppHttplibClient.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <httplib.h>
#include <regex>

namespace WCE {

namespace {

HttpClient::Response transportFailure(const std::string &error) {
    HttpClient::Response response;
    response.error = error;
    return response;
}

}  // namespace

CppHttplibClient::CppHttplibClient() {
    LOG_DEBUG("CppHttplibClient: Created HTTP client");
}

std::future<HttpClient::Response> CppHttplibClient::sendRequest(const HttpClient::Request &request) {
    auto timeout = request.timeout.value_or(timeout_.load());
    auto sslVerify = sslVerification_;
    auto headers = customHeaders_;

    return std::async(std::launch::async, [request, timeout, sslVerify, headers]() -> HttpClient::Response {
        try {
            auto url = parseUrl(request.url);
            if (!url) {
                LOG_ERROR("CppHttplibClient: Invalid URL: {}", request.url);
                return transportFailure("Invalid URL: " + request.url);
            }

            // Create base URL
            std::string baseUrl = url->scheme + "://" + url->host;
            if ((url->scheme == "http" && url->port != 80) || (url->scheme == "https" && url->port != 443)) {
                baseUrl += ":" + std::to_string(url->port);
            }

            std::string method = request.method.empty() ? "GET" : request.method;
            std::transform(method.begin(), method.end(), method.begin(),
                           [](unsigned char c) { return std::toupper(c); });

            LOG_DEBUG("CppHttplibClient: {} {} (timeout={}ms)", method, baseUrl + url->path, timeout.count());

            httplib::Client client(baseUrl);

            client.set_connection_timeout(timeout);
            client.set_read_timeout(timeout);
            client.set_write_timeout(timeout);

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            if (url->scheme == "https") {
                client.enable_server_certificate_verification(sslVerify);
            }
#else
            (void)sslVerify;
#endif

            // Request headers override client-wide ones
            std::map<std::string, std::string> merged = headers;
            for (const auto &[key, value] : request.headers) {
                merged[key] = value;
            }
            httplib::Headers httplibHeaders;
            for (const auto &[key, value] : merged) {
                httplibHeaders.emplace(key, value);
            }
            client.set_default_headers(httplibHeaders);

            std::string contentType = request.contentType.empty() ? "application/json" : request.contentType;

            httplib::Result result;
            if (method == "POST") {
                result = client.Post(url->path, request.body, contentType);
            } else if (method == "GET") {
                result = client.Get(url->path);
            } else if (method == "PUT") {
                result = client.Put(url->path, request.body, contentType);
            } else if (method == "PATCH") {
                result = client.Patch(url->path, request.body, contentType);
            } else if (method == "DELETE") {
                result = client.Delete(url->path);
            } else {
                LOG_ERROR("CppHttplibClient: Unsupported HTTP method: {}", method);
                return transportFailure("Unsupported HTTP method: " + method);
            }

            if (!result) {
                std::string error = httplib::to_string(result.error());
                LOG_ERROR("CppHttplibClient: Request to {} failed - {}", request.url, error);
                return transportFailure(error);
            }

            HttpClient::Response response;
            response.success = (result->status >= 200 && result->status < 300);
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto &[key, value] : result->headers) {
                response.headers[key] = value;
            }

            LOG_DEBUG("CppHttplibClient: Response {} {} (body {} bytes)", result->status,
                      response.success ? "OK" : "ERROR", response.body.size());
            return response;

        } catch (const std::exception &e) {
            LOG_ERROR("CppHttplibClient: Exception: {}", e.what());
            return transportFailure(e.what());
        }
    });
}

void CppHttplibClient::setTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    LOG_DEBUG("CppHttplibClient: Set timeout to {}ms", timeout.count());
}

void CppHttplibClient::setSSLVerification(bool verify) {
    sslVerification_ = verify;
    LOG_DEBUG("CppHttplibClient: SSL verification {}", verify ? "enabled" : "disabled");
}

void CppHttplibClient::setCustomHeaders(const std::map<std::string, std::string> &headers) {
    customHeaders_ = headers;
    LOG_DEBUG("CppHttplibClient: Set {} custom headers", headers.size());
}

std::optional<CppHttplibClient::ParsedUrl> CppHttplibClient::parseUrl(const std::string &url) {
    static const std::regex uriPattern(R"(^(https?)://([^:/\s]+)(?::(\d+))?(/.*)?$)", std::regex_constants::icase);
    std::smatch match;

    if (!std::regex_match(url, match, uriPattern)) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = match[1].str();
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    parsed.host = match[2].str();

    if (match[3].matched) {
        try {
            parsed.port = std::stoi(match[3].str());
        } catch (const std::exception &) {
            return std::nullopt;
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            return std::nullopt;
        }
    } else {
        parsed.port = (parsed.scheme == "https") ? 443 : 80;
    }

    parsed.path = match[4].matched ? match[4].str() : "/";
    return parsed;
}

}  // namespace WCE
