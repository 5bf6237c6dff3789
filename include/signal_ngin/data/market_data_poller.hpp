// include/signal_ngin/data/market_data_poller.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/data/candle_store.hpp"
#include "signal_ngin/data/quote_service.hpp"
#include "signal_ngin/instruments/instrument_registry.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for background price polling
 */
struct PollerConfig : public ConfigBase {
    int64_t interval_ms{5000};
    bool enabled{true};

    nlohmann::json to_json() const override {
        return nlohmann::json{{"interval_ms", interval_ms}, {"enabled", enabled}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("interval_ms"))
            interval_ms = j.at("interval_ms").get<int64_t>();
        if (j.contains("enabled"))
            enabled = j.at("enabled").get<bool>();
    }
};

/**
 * @brief Background thread feeding current prices into the candle store
 *
 * The poller is the only writer of candle state. A failing instrument is
 * logged and skipped; the others are still ingested.
 */
class MarketDataPoller {
public:
    MarketDataPoller(PollerConfig config, const InstrumentRegistry& registry,
                     QuoteService& quotes, CandleStore& candles);

    ~MarketDataPoller();

    MarketDataPoller(const MarketDataPoller&) = delete;
    MarketDataPoller& operator=(const MarketDataPoller&) = delete;

    /**
     * @brief Start the polling thread, polling once immediately
     * @return INVALID_ARGUMENT for a non-positive interval
     */
    Result<void> start();

    /**
     * @brief Stop the polling thread, waking it if it is waiting
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Fetch every instrument once and ingest the prices
     * @return Number of instruments ingested
     */
    size_t poll_once();

    uint64_t completed_polls() const {
        return completed_polls_.load();
    }

private:
    void run();

    PollerConfig config_;
    const InstrumentRegistry& registry_;
    QuoteService& quotes_;
    CandleStore& candles_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completed_polls_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
};

}  // namespace signal_ngin
