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

#include "common/Constants.h"
#include "events/IHttpClient.h"
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace WCE {

/**
 * @brief IHttpClient implementation backed by cpp-httplib
 *
 * Each request runs on its own std::async worker. HTTPS requires
 * cpp-httplib built with OpenSSL support.
 */
class CppHttplibClient : public IHttpClient {
public:
    CppHttplibClient();
    ~CppHttplibClient() override = default;

    std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) override;
    void setTimeout(std::chrono::milliseconds timeout) override;

    void setSSLVerification(bool verify);

    /**
     * @brief Headers added to every request (request headers win on conflict)
     */
    void setCustomHeaders(const std::map<std::string, std::string> &headers);

    struct ParsedUrl {
        std::string scheme;
        std::string host;
        int port = 0;
        std::string path;
    };

    /**
     * @brief Split an http(s) URL
     * @return Parts, or nullopt for unsupported or malformed URLs
     */
    static std::optional<ParsedUrl> parseUrl(const std::string &url);

private:
    std::atomic<std::chrono::milliseconds> timeout_{std::chrono::milliseconds(Constants::DEFAULT_HTTP_TIMEOUT_MS)};
    bool sslVerification_{true};
    std::map<std::string, std::string> customHeaders_;
};

}  // namespace WCE
