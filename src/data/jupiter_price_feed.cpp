// src/data/jupiter_price_feed.cpp
#include "signal_ngin/data/jupiter_price_feed.hpp"
#include <chrono>
#include <cmath>
#include <optional>

namespace signal_ngin {

namespace {

// Jupiter returns prices either as JSON numbers or as decimal strings
std::optional<double> read_number(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = value.get<std::string>();
            double parsed = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // namespace

JupiterPriceFeed::JupiterPriceFeed(JupiterFeedConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    if (!http_) {
        throw std::invalid_argument("JupiterPriceFeed requires an HTTP client");
    }
}

Result<PriceQuote> JupiterPriceFeed::fetch_price(const Instrument& instrument) {
    const std::string url = config_.base_url + "?ids=" + instrument.get_id();

    auto response = http_->get(url);
    if (response.is_error()) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      "Price request for " + instrument.get_symbol() +
                                          " failed: " + response.error()->what(),
                                      "JupiterPriceFeed");
    }

    if (!response.value().is_success()) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      "Jupiter price API returned HTTP " +
                                          std::to_string(response.value().status) + " for " +
                                          instrument.get_symbol(),
                                      "JupiterPriceFeed");
    }

    auto quote = parse_response(response.value().body, instrument.get_id(),
                                std::chrono::system_clock::now());
    if (quote.is_error()) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      instrument.get_symbol() + ": " + quote.error()->what(),
                                      "JupiterPriceFeed");
    }
    return quote;
}

Result<PriceQuote> JupiterPriceFeed::parse_response(const std::string& body,
                                                    const std::string& instrument_id,
                                                    Timestamp timestamp) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      std::string("Unparsable price response: ") + e.what(),
                                      "JupiterPriceFeed");
    }

    if (!data.is_object() || !data.contains(instrument_id) ||
        !data.at(instrument_id).is_object()) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      "No price data available for " + instrument_id,
                                      "JupiterPriceFeed");
    }

    const auto& info = data.at(instrument_id);
    std::optional<double> price;
    if (info.contains("usdPrice")) {
        price = read_number(info.at("usdPrice"));
    }
    if (!price || !std::isfinite(*price) || *price <= 0.0) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR,
                                      "Missing or non-positive usdPrice for " + instrument_id,
                                      "JupiterPriceFeed");
    }

    PriceQuote quote;
    quote.instrument_id = instrument_id;
    quote.price = *price;
    quote.timestamp = timestamp;
    quote.source = "jupiter";
    if (info.contains("priceChange24h") && !info.at("priceChange24h").is_null()) {
        auto change = read_number(info.at("priceChange24h"));
        if (change && std::isfinite(*change)) {
            quote.price_change_24h = *change;
        }
    }
    return quote;
}

}  // namespace signal_ngin
