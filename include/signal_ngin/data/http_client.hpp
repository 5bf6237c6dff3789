// include/signal_ngin/data/http_client.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Status and body of a completed HTTP exchange
 */
struct HttpResponse {
    long status{0};
    std::string body;

    bool is_success() const {
        return status >= 200 && status < 300;
    }
};

/**
 * @brief Minimal HTTP client used by the price feed and the payment gate
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform an HTTP GET request
     * @param url Absolute URL
     * @param headers Extra header lines ("Name: value")
     * @return CONNECTION_ERROR or TIMEOUT_ERROR on transport failure
     */
    virtual Result<HttpResponse> get(const std::string& url,
                                     const std::vector<std::string>& headers = {}) = 0;

    /**
     * @brief Perform an HTTP POST request with a JSON body
     */
    virtual Result<HttpResponse> post(const std::string& url, const std::string& payload,
                                      const std::vector<std::string>& headers = {}) = 0;
};

/**
 * @brief libcurl implementation, one easy handle per request
 *
 * Every request carries a connect and a total timeout, so an in-flight
 * request aborts rather than hangs.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds timeout);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers = {}) override;

    Result<HttpResponse> post(const std::string& url, const std::string& payload,
                              const std::vector<std::string>& headers = {}) override;

private:
    Result<HttpResponse> perform_request(const std::string& method, const std::string& url,
                                         const std::string& payload,
                                         const std::vector<std::string>& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb,
                                 std::string* user_data);

    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds timeout_;
};

}  // namespace signal_ngin
