// src/service/payment_gate.cpp
#include "signal_ngin/service/payment_gate.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

std::optional<std::string> RequestContext::header(const std::string& name) const {
    const std::string wanted = lowercase(name);
    for (const auto& [key, value] : headers) {
        if (lowercase(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

std::string OperationPricing::formatted() const {
    return PaymentConfig::format_price(amount);
}

std::map<std::string, OperationPricing> PaymentConfig::default_pricing() {
    return {
        {"get-current-prices", {10000, "Real-time asset prices"}},
        {"get-ohlc-data", {20000, "OHLC candlestick data"}},
        {"get-ohlc-stats", {5000, "OHLC collection statistics"}},
        {"get-rsi-analysis", {50000, "RSI trading signal analysis"}},
        {"get-portfolio-signals", {100000, "Portfolio-wide trading signals"}},
        {"get-rsi-divergence", {50000, "RSI divergence pattern detection"}},
    };
}

std::string PaymentConfig::format_price(int64_t micro_usdc) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "$%.3f USDC", static_cast<double>(micro_usdc) / 1e6);
    return std::string(buffer);
}

std::optional<OperationPricing> PaymentConfig::price_of(const std::string& operation) const {
    auto it = pricing.find(operation);
    if (it == pricing.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json PaymentConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["facilitator_url"] = facilitator_url;
    j["network"] = network;
    j["resource_prefix"] = resource_prefix;
    j["connect_timeout_ms"] = connect_timeout_ms;
    j["request_timeout_ms"] = request_timeout_ms;
    nlohmann::json prices = nlohmann::json::object();
    for (const auto& [operation, price] : pricing) {
        prices[operation] = {{"amount", price.amount}, {"description", price.description}};
    }
    j["pricing"] = prices;
    return j;
}

void PaymentConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("facilitator_url"))
        facilitator_url = j.at("facilitator_url").get<std::string>();
    if (j.contains("network"))
        network = j.at("network").get<std::string>();
    if (j.contains("resource_prefix"))
        resource_prefix = j.at("resource_prefix").get<std::string>();
    if (j.contains("connect_timeout_ms"))
        connect_timeout_ms = j.at("connect_timeout_ms").get<int>();
    if (j.contains("request_timeout_ms"))
        request_timeout_ms = j.at("request_timeout_ms").get<int>();
    if (j.contains("pricing")) {
        for (const auto& [operation, value] : j.at("pricing").items()) {
            OperationPricing& price = pricing[operation];
            if (value.contains("amount"))
                price.amount = value.at("amount").get<int64_t>();
            if (value.contains("description"))
                price.description = value.at("description").get<std::string>();
        }
    }
}

Authorization OpenPaymentGate::authorize(const std::string&, const RequestContext&) {
    return {true, "Payments disabled"};
}

FacilitatorPaymentGate::FacilitatorPaymentGate(PaymentConfig config,
                                               std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (!http_) {
        throw std::invalid_argument("FacilitatorPaymentGate requires an HTTP client");
    }
}

Authorization FacilitatorPaymentGate::authorize(const std::string& operation,
                                                const RequestContext& context) {
    auto price = config_.price_of(operation);
    if (!price) {
        return {false, "No pricing configured for operation: " + operation};
    }

    auto payment_header = context.header("X-PAYMENT");
    if (!payment_header || payment_header->empty()) {
        return {false, "Payment required: missing X-PAYMENT header"};
    }

    nlohmann::json request{{"paymentHeader", *payment_header},
                           {"operation", operation},
                           {"amount", std::to_string(price->amount)},
                           {"network", config_.network},
                           {"resource", config_.resource_prefix + operation}};

    auto response = http_->post(config_.facilitator_url + "/verify", request.dump());
    if (response.is_error()) {
        WARN("Payment verification for " << operation
                                         << " failed: " << response.error()->what());
        return {false, std::string("Payment verification failed: ") + response.error()->what()};
    }
    if (!response.value().is_success()) {
        return {false, "Facilitator rejected payment (HTTP " +
                           std::to_string(response.value().status) + ")"};
    }

    try {
        auto body = nlohmann::json::parse(response.value().body);
        if (body.value("isValid", false)) {
            INFO("Payment verified for " << operation);
            return {true, "Payment verified"};
        }
        return {false, "Payment invalid: " + body.value("invalidReason", std::string("unknown"))};
    } catch (const nlohmann::json::exception& e) {
        return {false, std::string("Unparsable facilitator response: ") + e.what()};
    }
}

}  // namespace signal_ngin
