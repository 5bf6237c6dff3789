// include/signal_ngin/data/quote_service.hpp
#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/core/worker_pool.hpp"
#include "signal_ngin/data/candle_store.hpp"
#include "signal_ngin/data/price_feed.hpp"
#include "signal_ngin/data/quote_cache.hpp"
#include "signal_ngin/instruments/instrument_registry.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for the quote service
 */
struct QuoteServiceConfig : public ConfigBase {
    QuoteCacheConfig cache;
    int64_t batch_timeout_ms{10000};  // deadline of a get_current_prices fan-out

    nlohmann::json to_json() const override {
        return nlohmann::json{{"cache", cache.to_json()}, {"batch_timeout_ms", batch_timeout_ms}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("cache"))
            cache.from_json(j.at("cache"));
        if (j.contains("batch_timeout_ms"))
            batch_timeout_ms = j.at("batch_timeout_ms").get<int64_t>();
    }
};

/**
 * @brief Cached access to current instrument prices
 */
class QuoteService {
public:
    /**
     * @brief Constructor
     * @param config Cache and batch settings
     * @param registry Instrument universe
     * @param feed Upstream price source
     * @param candles Candle store used to derive missing 24h changes
     * @param fetch_pool Pool running concurrent fetches
     * @param clock Clock for cache expiry
     */
    QuoteService(QuoteServiceConfig config, const InstrumentRegistry& registry,
                 std::shared_ptr<PriceFeed> feed, const CandleStore& candles,
                 WorkerPool& fetch_pool,
                 QuoteCache<PriceQuote>::Clock clock = []() {
                     return std::chrono::system_clock::now();
                 });

    /**
     * @brief Current price of an instrument given by id or symbol
     * @return INSTRUMENT_NOT_FOUND or UPSTREAM_FETCH_ERROR
     */
    Result<PriceQuote> get_price(const std::string& id_or_symbol);

    Result<PriceQuote> get_price(const Instrument& instrument);

    /**
     * @brief Current prices of all instruments, optionally of one category
     *
     * Instruments whose fetch fails are logged and left out.
     *
     * @return UPSTREAM_FETCH_ERROR only when every fetch failed
     */
    Result<std::vector<PriceQuote>> get_current_prices(
        std::optional<InstrumentCategory> category = std::nullopt);

    /**
     * @brief Percent change against the open of the 1h candle 24 hours back
     * @return nullopt with fewer than 24 hourly candles
     */
    std::optional<double> derive_change_24h(const std::string& instrument_id,
                                            Price current_price) const;

    size_t cache_size() const {
        return cache_.size();
    }

private:
    static std::string cache_key(const std::string& instrument_id) {
        return "price_" + instrument_id;
    }

    QuoteServiceConfig config_;
    const InstrumentRegistry& registry_;
    std::shared_ptr<PriceFeed> feed_;
    const CandleStore& candles_;
    WorkerPool& fetch_pool_;
    QuoteCache<PriceQuote> cache_;
};

}  // namespace signal_ngin
