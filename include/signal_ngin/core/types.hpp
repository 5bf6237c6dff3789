// include/signal_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Candle intervals tracked by the aggregator
 */
enum class Interval {
    SECOND_1,  // 1s
    MINUTE_1,  // 1m
    MINUTE_5,  // 5m
    HOUR_1,    // 1h
    WEEK_1,    // 1w
    MONTH_1    // 1M (30 days)
};

/**
 * @brief Every supported interval, shortest first
 */
inline const std::vector<Interval>& all_intervals() {
    static const std::vector<Interval> intervals{Interval::SECOND_1, Interval::MINUTE_1,
                                                 Interval::MINUTE_5, Interval::HOUR_1,
                                                 Interval::WEEK_1,   Interval::MONTH_1};
    return intervals;
}

/**
 * @brief Bucket duration of an interval
 */
inline std::chrono::milliseconds interval_duration(Interval interval) {
    switch (interval) {
        case Interval::SECOND_1:
            return std::chrono::seconds(1);
        case Interval::MINUTE_1:
            return std::chrono::minutes(1);
        case Interval::MINUTE_5:
            return std::chrono::minutes(5);
        case Interval::HOUR_1:
            return std::chrono::hours(1);
        case Interval::WEEK_1:
            return std::chrono::hours(24 * 7);
        case Interval::MONTH_1:
            return std::chrono::hours(24 * 30);
    }
    return std::chrono::minutes(1);
}

inline std::string interval_to_string(Interval interval) {
    switch (interval) {
        case Interval::SECOND_1:
            return "1s";
        case Interval::MINUTE_1:
            return "1m";
        case Interval::MINUTE_5:
            return "5m";
        case Interval::HOUR_1:
            return "1h";
        case Interval::WEEK_1:
            return "1w";
        case Interval::MONTH_1:
            return "1M";
    }
    return "1m";
}

/**
 * @brief Parse the short interval form ("1s", "5m", "1M", ...)
 */
inline Result<Interval> parse_interval(const std::string& text) {
    for (Interval interval : all_intervals()) {
        if (interval_to_string(interval) == text) {
            return interval;
        }
    }
    return make_error<Interval>(ErrorCode::INVALID_ARGUMENT, "Unsupported interval: " + text,
                                "Interval");
}

/**
 * @brief Asset class of a tracked instrument
 */
enum class InstrumentCategory { WRAPPED_BTC, TOKENIZED_STOCK, GOLD_TOKEN };

inline const std::vector<InstrumentCategory>& all_categories() {
    static const std::vector<InstrumentCategory> categories{InstrumentCategory::WRAPPED_BTC,
                                                            InstrumentCategory::TOKENIZED_STOCK,
                                                            InstrumentCategory::GOLD_TOKEN};
    return categories;
}

inline std::string category_to_string(InstrumentCategory category) {
    switch (category) {
        case InstrumentCategory::WRAPPED_BTC:
            return "wrapped-btc";
        case InstrumentCategory::TOKENIZED_STOCK:
            return "rwa-stocks";
        case InstrumentCategory::GOLD_TOKEN:
            return "gold";
    }
    return "wrapped-btc";
}

inline Result<InstrumentCategory> parse_category(const std::string& text) {
    for (InstrumentCategory category : all_categories()) {
        if (category_to_string(category) == text) {
            return category;
        }
    }
    return make_error<InstrumentCategory>(ErrorCode::INVALID_ARGUMENT,
                                          "Unknown instrument category: " + text,
                                          "InstrumentCategory");
}

/**
 * @brief OHLC candle for one interval bucket
 *
 * Invariant: low <= {open, close} <= high, bucket_start is a multiple of the
 * interval duration.
 */
struct Candle {
    Timestamp bucket_start;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    std::optional<double> volume;

    Candle() = default;
    Candle(Timestamp start, Price o, Price h, Price l, Price c)
        : bucket_start(start), open(o), high(h), low(l), close(c) {}
};

/**
 * @brief A single price reading for one instrument
 */
struct PriceQuote {
    std::string instrument_id;
    Price price{0.0};
    Timestamp timestamp;
    std::string source;
    std::optional<double> price_change_24h;
};

/**
 * @brief Advisory action emitted by the signal detector
 */
enum class SignalAction { BUY, SELL, HOLD };

inline std::string action_to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            return "BUY";
        case SignalAction::SELL:
            return "SELL";
        case SignalAction::HOLD:
            return "HOLD";
    }
    return "HOLD";
}

}  // namespace signal_ngin
