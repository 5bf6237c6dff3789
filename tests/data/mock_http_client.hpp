#pragma once

#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "signal_ngin/data/http_client.hpp"

namespace signal_ngin {
namespace testing {

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD(Result<HttpResponse>, get,
                (const std::string& url, const std::vector<std::string>& headers), (override));
    MOCK_METHOD(Result<HttpResponse>, post,
                (const std::string& url, const std::string& payload,
                 const std::vector<std::string>& headers),
                (override));
};

inline Result<HttpResponse> http_ok(const std::string& body) {
    HttpResponse response;
    response.status = 200;
    response.body = body;
    return Result<HttpResponse>(std::move(response));
}

inline Result<HttpResponse> http_status(long status, const std::string& body = "") {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return Result<HttpResponse>(std::move(response));
}

}  // namespace testing
}  // namespace signal_ngin
