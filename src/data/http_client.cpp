// src/data/http_client.cpp
#include "signal_ngin/data/http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace signal_ngin {

namespace {

std::once_flag curl_init_flag;

struct CurlHandleDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds timeout)
    : connect_timeout_(connect_timeout), timeout_(timeout) {
    // curl_global_init is not thread-safe and must run once per process
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                      std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         const std::vector<std::string>& headers) {
    return perform_request("GET", url, "", headers);
}

Result<HttpResponse> CurlHttpClient::post(const std::string& url, const std::string& payload,
                                          const std::vector<std::string>& headers) {
    return perform_request("POST", url, payload, headers);
}

Result<HttpResponse> CurlHttpClient::perform_request(const std::string& method,
                                                     const std::string& url,
                                                     const std::string& payload,
                                                     const std::vector<std::string>& headers) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        "HttpClient");
    }

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (method == "POST") {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    }
    for (const auto& header : headers) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> header_list(raw_headers);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR,
                                        method + " " + url + " timed out", "HttpClient");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(
            ErrorCode::CONNECTION_ERROR,
            method + " " + url + " failed: " + std::string(curl_easy_strerror(res)),
            "HttpClient");
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace signal_ngin
