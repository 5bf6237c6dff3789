// src/data/candle_store.cpp
#include "signal_ngin/data/candle_store.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

nlohmann::json CandleStoreConfig::to_json() const {
    nlohmann::json j;
    j["max_candles"] = max_candles;
    nlohmann::json interval_names = nlohmann::json::array();
    for (Interval interval : intervals) {
        interval_names.push_back(interval_to_string(interval));
    }
    j["intervals"] = interval_names;
    return j;
}

void CandleStoreConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_candles"))
        max_candles = j.at("max_candles").get<size_t>();
    if (j.contains("intervals")) {
        std::vector<Interval> parsed;
        for (const auto& name : j.at("intervals")) {
            auto interval = parse_interval(name.get<std::string>());
            if (interval.is_error()) {
                throw *interval.error();
            }
            parsed.push_back(interval.value());
        }
        intervals = std::move(parsed);
    }
}

CandleStore::CandleStore(CandleStoreConfig config) : config_(std::move(config)) {
    if (config_.max_candles == 0) {
        throw std::invalid_argument("CandleStore max_candles must be positive");
    }
}

Timestamp CandleStore::bucket_start(Timestamp timestamp, Interval interval) {
    int64_t ts_ms = core::to_epoch_ms(timestamp);
    int64_t dur_ms = interval_duration(interval).count();
    int64_t bucket = ts_ms / dur_ms;
    if (ts_ms % dur_ms < 0) {
        --bucket;
    }
    return core::from_epoch_ms(bucket * dur_ms);
}

CandleStore::Series* CandleStore::find_series(const SeriesKey& key) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = series_.find(key);
    return it == series_.end() ? nullptr : it->second.get();
}

CandleStore::Series& CandleStore::get_or_create_series(const SeriesKey& key) {
    if (Series* existing = find_series(key)) {
        return *existing;
    }
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto& slot = series_[key];
    if (!slot) {
        slot = std::make_unique<Series>();
    }
    return *slot;
}

bool CandleStore::apply_observation(Series& series, Timestamp bucket, Price price) {
    auto& candles = series.candles;

    if (candles.empty() || bucket > candles.back().bucket_start) {
        candles.emplace_back(bucket, price, price, price, price);
        while (candles.size() > config_.max_candles) {
            candles.pop_front();
        }
        return true;
    }

    auto it = std::lower_bound(
        candles.begin(), candles.end(), bucket,
        [](const Candle& candle, Timestamp start) { return candle.bucket_start < start; });
    if (it == candles.end() || it->bucket_start != bucket) {
        return false;
    }

    it->high = std::max(it->high, price);
    it->low = std::min(it->low, price);
    it->close = price;
    return true;
}

Result<void> CandleStore::ingest(const std::string& instrument_id, Price price,
                                 Timestamp timestamp) {
    if (!std::isfinite(price) || price <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Rejected price " + std::to_string(price) + " for " +
                                    instrument_id,
                                "CandleStore");
    }

    for (Interval interval : config_.intervals) {
        Series& series = get_or_create_series({instrument_id, interval});
        Timestamp bucket = bucket_start(timestamp, interval);

        std::unique_lock<std::shared_mutex> lock(series.mutex);
        if (!apply_observation(series, bucket, price)) {
            DEBUG("Skipped stale observation for " << instrument_id << " "
                                                   << interval_to_string(interval) << " at "
                                                   << core::to_iso8601(timestamp));
        }
    }
    return Result<void>();
}

Result<std::vector<Candle>> CandleStore::get_candles(const std::string& instrument_id,
                                                     Interval interval, size_t count) const {
    if (count == 0) {
        return make_error<std::vector<Candle>>(ErrorCode::INVALID_ARGUMENT,
                                               "Candle count must be positive", "CandleStore");
    }

    Series* series = find_series({instrument_id, interval});
    if (series == nullptr) {
        return make_error<std::vector<Candle>>(
            ErrorCode::INSUFFICIENT_DATA,
            "No candles for " + instrument_id + " at " + interval_to_string(interval),
            "CandleStore");
    }

    std::shared_lock<std::shared_mutex> lock(series->mutex);
    if (series->candles.empty()) {
        return make_error<std::vector<Candle>>(
            ErrorCode::INSUFFICIENT_DATA,
            "No candles for " + instrument_id + " at " + interval_to_string(interval),
            "CandleStore");
    }

    size_t available = series->candles.size();
    size_t take = std::min(count, available);
    return std::vector<Candle>(series->candles.end() - static_cast<std::ptrdiff_t>(take),
                               series->candles.end());
}

std::vector<SeriesStats> CandleStore::get_stats() const {
    std::vector<SeriesStats> stats;
    std::shared_lock<std::shared_mutex> registry_lock(registry_mutex_);
    stats.reserve(series_.size());

    for (const auto& [key, series] : series_) {
        SeriesStats entry;
        entry.instrument_id = key.first;
        entry.interval = key.second;

        std::shared_lock<std::shared_mutex> lock(series->mutex);
        entry.candle_count = series->candles.size();
        if (!series->candles.empty()) {
            entry.oldest = series->candles.front().bucket_start;
            entry.newest = series->candles.back().bucket_start;
        }
        stats.push_back(std::move(entry));
    }
    return stats;
}

size_t CandleStore::candle_count(const std::string& instrument_id, Interval interval) const {
    Series* series = find_series({instrument_id, interval});
    if (series == nullptr) {
        return 0;
    }
    std::shared_lock<std::shared_mutex> lock(series->mutex);
    return series->candles.size();
}

}  // namespace signal_ngin
