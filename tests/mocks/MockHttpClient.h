#pragma once

#include "events/IHttpClient.h"
#include <chrono>
#include <future>
#include <gmock/gmock.h>
#include <string>

namespace WCE {
namespace Test {

/**
 * @brief gmock implementation of IHttpClient for http_request node tests
 */
class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(std::future<HttpClient::Response>, sendRequest, (const HttpClient::Request &request), (override));
    MOCK_METHOD(void, setTimeout, (std::chrono::milliseconds timeout), (override));

    /**
     * @brief Ready future carrying the given response
     */
    static std::future<HttpClient::Response> respond(int statusCode, const std::string &body = "",
                                                     const std::string &error = "") {
        HttpClient::Response response;
        response.statusCode = statusCode;
        response.success = statusCode >= 200 && statusCode < 300;
        response.body = body;
        response.error = error;

        std::promise<HttpClient::Response> promise;
        promise.set_value(std::move(response));
        return promise.get_future();
    }
};

}  // namespace Test
}  // namespace WCE
