// include/signal_ngin/data/candle_store.hpp
#pragma once

#include <deque>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for candle aggregation
 */
struct CandleStoreConfig : public ConfigBase {
    size_t max_candles{1000};
    std::vector<Interval> intervals{all_intervals()};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Number of retained candles of one (instrument, interval) series
 */
struct SeriesStats {
    std::string instrument_id;
    Interval interval{Interval::MINUTE_1};
    size_t candle_count{0};
    std::optional<Timestamp> oldest;
    std::optional<Timestamp> newest;
};

/**
 * @brief In-memory OHLC aggregation of price observations
 *
 * Each observation updates the candle of its bucket on every configured
 * interval. Series are capped at max_candles with the oldest candle evicted
 * first. The series registry and every series carry their own reader/writer
 * lock; readers receive copies.
 */
class CandleStore {
public:
    explicit CandleStore(CandleStoreConfig config);

    CandleStore(const CandleStore&) = delete;
    CandleStore& operator=(const CandleStore&) = delete;

    /**
     * @brief Fold a price observation into every configured interval
     * @param instrument_id Canonical instrument id
     * @param price Observed price, finite and positive
     * @param timestamp Observation time
     * @return INVALID_DATA for a non-finite or non-positive price
     */
    Result<void> ingest(const std::string& instrument_id, Price price, Timestamp timestamp);

    /**
     * @brief Most recent candles of a series, oldest first
     * @param count Maximum number of candles, at least one
     * @return INSUFFICIENT_DATA when the series is empty or unknown
     */
    Result<std::vector<Candle>> get_candles(const std::string& instrument_id, Interval interval,
                                            size_t count) const;

    /**
     * @brief Candle counts of every series, ordered by instrument then interval
     */
    std::vector<SeriesStats> get_stats() const;

    size_t candle_count(const std::string& instrument_id, Interval interval) const;

    const CandleStoreConfig& config() const {
        return config_;
    }

    /**
     * @brief Start of the bucket containing a timestamp
     */
    static Timestamp bucket_start(Timestamp timestamp, Interval interval);

private:
    struct Series {
        mutable std::shared_mutex mutex;
        std::deque<Candle> candles;
    };

    using SeriesKey = std::pair<std::string, Interval>;

    Series* find_series(const SeriesKey& key) const;
    Series& get_or_create_series(const SeriesKey& key);

    // Returns false when the observation predates every retained candle of its bucket
    bool apply_observation(Series& series, Timestamp bucket, Price price);

    CandleStoreConfig config_;
    std::map<SeriesKey, std::unique_ptr<Series>> series_;
    mutable std::shared_mutex registry_mutex_;
};

}  // namespace signal_ngin
