// include/signal_ngin/service/payment_gate.hpp
#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/http_client.hpp"

namespace signal_ngin {

/**
 * @brief Caller metadata relevant to authorization
 */
struct RequestContext {
    std::map<std::string, std::string> headers;
    std::string session_id;

    /**
     * @brief Case-insensitive header lookup
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief Decision of the payment gate
 */
struct Authorization {
    bool granted{false};
    std::string reason;
};

/**
 * @brief Price of one operation in USDC micro-units
 */
struct OperationPricing {
    int64_t amount{0};
    std::string description;

    /**
     * @brief Dollar form such as "$0.050 USDC"
     */
    std::string formatted() const;
};

/**
 * @brief Configuration for metered operations
 */
struct PaymentConfig : public ConfigBase {
    bool enabled{false};
    std::string facilitator_url{"https://facilitator.payai.network"};
    std::string network{"solana"};
    std::string resource_prefix{"mcp://tools/"};
    int connect_timeout_ms{3000};
    int request_timeout_ms{10000};
    std::map<std::string, OperationPricing> pricing{default_pricing()};

    static std::map<std::string, OperationPricing> default_pricing();

    /**
     * @brief Format micro-USDC as "$x.xxx USDC"
     */
    static std::string format_price(int64_t micro_usdc);

    std::optional<OperationPricing> price_of(const std::string& operation) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Decides whether a caller may invoke a metered operation
 */
class PaymentGate {
public:
    virtual ~PaymentGate() = default;

    virtual Authorization authorize(const std::string& operation,
                                    const RequestContext& context) = 0;
};

/**
 * @brief Gate used when payments are disabled; grants every request
 */
class OpenPaymentGate : public PaymentGate {
public:
    Authorization authorize(const std::string& operation, const RequestContext& context) override;
};

/**
 * @brief Gate verifying the X-PAYMENT header with a payment facilitator
 *
 * Missing header, unpriced operation, transport failure or a negative
 * verification all deny the request.
 */
class FacilitatorPaymentGate : public PaymentGate {
public:
    FacilitatorPaymentGate(PaymentConfig config, std::shared_ptr<HttpClient> http);

    Authorization authorize(const std::string& operation, const RequestContext& context) override;

private:
    PaymentConfig config_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace signal_ngin
