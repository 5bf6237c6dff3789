// include/signal_ngin/data/jupiter_price_feed.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/http_client.hpp"
#include "signal_ngin/data/price_feed.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for the Jupiter price API
 */
struct JupiterFeedConfig : public ConfigBase {
    std::string base_url{"https://lite-api.jup.ag/price/v3"};
    int connect_timeout_ms{3000};
    int request_timeout_ms{5000};

    nlohmann::json to_json() const override {
        return nlohmann::json{{"base_url", base_url},
                              {"connect_timeout_ms", connect_timeout_ms},
                              {"request_timeout_ms", request_timeout_ms}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("connect_timeout_ms"))
            connect_timeout_ms = j.at("connect_timeout_ms").get<int>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = j.at("request_timeout_ms").get<int>();
    }
};

/**
 * @brief Price feed backed by the Jupiter price API (one request per instrument)
 */
class JupiterPriceFeed : public PriceFeed {
public:
    JupiterPriceFeed(JupiterFeedConfig config, std::shared_ptr<HttpClient> http);

    Result<PriceQuote> fetch_price(const Instrument& instrument) override;

    std::string name() const override {
        return "jupiter";
    }

    /**
     * @brief Extract a quote from a Jupiter response body
     *
     * Reads body[id].usdPrice (number or numeric string) and the optional
     * priceChange24h.
     *
     * @param body Raw response body
     * @param instrument_id Mint address used as the response key
     * @param timestamp Observation time to stamp on the quote
     * @return UPSTREAM_FETCH_ERROR on malformed body, missing or non-positive price
     */
    static Result<PriceQuote> parse_response(const std::string& body,
                                             const std::string& instrument_id,
                                             Timestamp timestamp);

private:
    JupiterFeedConfig config_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace signal_ngin
