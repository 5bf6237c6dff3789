// src/analysis/rsi_analyzer.cpp
#include "signal_ngin/analysis/rsi_analyzer.hpp"
#include <algorithm>
#include <chrono>
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/task_group.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

constexpr int kDivergenceRsiPeriod = 14;
constexpr size_t kDivergenceMinCandles = 50;
constexpr size_t kDivergenceExtraCandles = 20;

std::vector<Interval> parse_interval_list(const nlohmann::json& names) {
    std::vector<Interval> parsed;
    for (const auto& name : names) {
        auto interval = parse_interval(name.get<std::string>());
        if (interval.is_error()) {
            throw *interval.error();
        }
        parsed.push_back(interval.value());
    }
    return parsed;
}

}  // namespace

nlohmann::json AnalysisConfig::to_json() const {
    nlohmann::json j;
    j["candle_count"] = candle_count;
    j["mtf_intervals"] = nlohmann::json::array();
    for (Interval interval : mtf_intervals) {
        j["mtf_intervals"].push_back(interval_to_string(interval));
    }
    j["mtf_candle_count"] = mtf_candle_count;
    j["mtf_rsi_period"] = mtf_rsi_period;
    j["divergence_lookback"] = divergence_lookback;
    j["momentum_lookback"] = momentum_lookback;
    j["task_timeout_ms"] = task_timeout_ms;
    return j;
}

void AnalysisConfig::from_json(const nlohmann::json& j) {
    if (j.contains("candle_count"))
        candle_count = j.at("candle_count").get<size_t>();
    if (j.contains("mtf_intervals"))
        mtf_intervals = parse_interval_list(j.at("mtf_intervals"));
    if (j.contains("mtf_candle_count"))
        mtf_candle_count = j.at("mtf_candle_count").get<size_t>();
    if (j.contains("mtf_rsi_period"))
        mtf_rsi_period = j.at("mtf_rsi_period").get<int>();
    if (j.contains("divergence_lookback"))
        divergence_lookback = j.at("divergence_lookback").get<size_t>();
    if (j.contains("momentum_lookback"))
        momentum_lookback = j.at("momentum_lookback").get<size_t>();
    if (j.contains("task_timeout_ms"))
        task_timeout_ms = j.at("task_timeout_ms").get<int64_t>();
}

std::string rsi_status_to_string(RsiStatus status) {
    switch (status) {
        case RsiStatus::OVERSOLD:
            return "oversold";
        case RsiStatus::NEUTRAL:
            return "neutral";
        case RsiStatus::OVERBOUGHT:
            return "overbought";
    }
    return "neutral";
}

nlohmann::json InstrumentAnalysis::to_json() const {
    nlohmann::json j;
    j["instrument"] = instrument ? instrument->to_json() : nlohmann::json(nullptr);
    j["current_price"] = current_price;
    j["rsi"] = {{"value", rsi_value},
                {"period", rsi_period},
                {"interval", interval_to_string(interval)},
                {"status", rsi_status_to_string(status)}};
    j["signal"] = signal.to_json();

    nlohmann::json timeframes = nlohmann::json::object();
    for (const auto& tf : multi_timeframe) {
        timeframes[interval_to_string(tf.interval)] = {{"rsi", tf.value},
                                                       {"status", rsi_status_to_string(tf.status)}};
    }
    j["analysis"] = {
        {"divergence", divergence.any() ? divergence.to_json() : nlohmann::json(nullptr)},
        {"momentum", momentum_to_string(momentum)},
        {"multi_timeframe", timeframes}};
    j["timestamp"] = core::to_iso8601(timestamp);
    return j;
}

void ActionCounts::add(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            ++buy;
            break;
        case SignalAction::SELL:
            ++sell;
            break;
        case SignalAction::HOLD:
            ++hold;
            break;
    }
}

nlohmann::json ActionCounts::to_json() const {
    return nlohmann::json{{"buy", buy}, {"sell", sell}, {"hold", hold}};
}

nlohmann::json PortfolioSummary::to_json() const {
    nlohmann::json j;
    j["total_buy_signals"] = totals.buy;
    j["total_sell_signals"] = totals.sell;
    j["total_hold_signals"] = totals.hold;
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [category, counts] : by_category) {
        categories[category_to_string(category)] = counts.to_json();
    }
    j["by_category"] = categories;
    return j;
}

RsiAnalyzer::RsiAnalyzer(AnalysisConfig config, const CandleStore& candles,
                         const SignalDetector& detector, WorkerPool& pool)
    : config_(std::move(config)), candles_(candles), detector_(detector), pool_(pool) {}

RsiStatus RsiAnalyzer::classify_status(double rsi, InstrumentCategory category) const {
    const CategoryThresholds& t = detector_.policy().for_category(category);
    if (rsi < t.oversold)
        return RsiStatus::OVERSOLD;
    if (rsi > t.overbought)
        return RsiStatus::OVERBOUGHT;
    return RsiStatus::NEUTRAL;
}

Result<InstrumentAnalysis> RsiAnalyzer::analyze_instrument(const Instrument& instrument,
                                                           std::optional<Interval> interval) const {
    const CategoryThresholds& t = detector_.policy().for_category(instrument.get_category());
    const Interval timeframe = interval.value_or(t.default_interval);

    auto candles_result = candles_.get_candles(instrument.get_id(), timeframe, config_.candle_count);
    if (candles_result.is_error()) {
        return forward_error<InstrumentAnalysis>(candles_result, "RsiAnalyzer");
    }
    const std::vector<Candle>& candles = candles_result.value();

    RsiCalculator calculator(t.rsi_period);
    RsiSeries rsi = calculator.series(candles);
    auto current_rsi = RsiCalculator::latest(rsi);
    if (!current_rsi) {
        return make_error<InstrumentAnalysis>(
            ErrorCode::INSUFFICIENT_DATA,
            "Unable to calculate RSI(" + std::to_string(t.rsi_period) + ") for " +
                instrument.get_symbol() + " at " + interval_to_string(timeframe) + ": " +
                std::to_string(candles.size()) + " candles available",
            "RsiAnalyzer");
    }

    InstrumentAnalysis analysis;
    analysis.instrument = std::make_shared<const Instrument>(instrument);
    analysis.current_price = candles.back().close;
    analysis.rsi_value = *current_rsi;
    analysis.rsi_period = t.rsi_period;
    analysis.interval = timeframe;
    analysis.status = classify_status(*current_rsi, instrument.get_category());
    analysis.divergence = divergence_detector_.detect(rsi, candles, config_.divergence_lookback);
    analysis.signal =
        detector_.evaluate(rsi, candles, instrument.get_category(), analysis.divergence);
    analysis.momentum = classify_momentum(rsi, config_.momentum_lookback);
    analysis.multi_timeframe = multi_timeframe_rsi(instrument, config_.mtf_intervals);
    analysis.timestamp = std::chrono::system_clock::now();
    return analysis;
}

std::vector<TimeframeRsi> RsiAnalyzer::multi_timeframe_rsi(
    const Instrument& instrument, const std::vector<Interval>& intervals) const {
    std::vector<TimeframeRsi> results;
    RsiCalculator calculator(config_.mtf_rsi_period);

    for (Interval interval : intervals) {
        auto candles = candles_.get_candles(instrument.get_id(), interval, config_.mtf_candle_count);
        if (candles.is_error()) {
            DEBUG("No " << interval_to_string(interval) << " RSI for " << instrument.get_symbol()
                        << ": " << candles.error()->what());
            continue;
        }

        auto current = RsiCalculator::latest(calculator.series(candles.value()));
        if (!current) {
            continue;
        }
        results.push_back({interval, *current, classify_status(*current, instrument.get_category())});
    }
    return results;
}

std::vector<Result<InstrumentAnalysis>> RsiAnalyzer::analyze_many(
    const std::vector<std::shared_ptr<const Instrument>>& instruments,
    std::optional<Interval> interval) const {
    std::vector<SettledTask<InstrumentAnalysis>> tasks;
    tasks.reserve(instruments.size());

    for (const auto& instrument : instruments) {
        tasks.push_back([this, instrument, interval](const CancellationToken& token)
                            -> Result<InstrumentAnalysis> {
            auto result = analyze_instrument(*instrument, interval);
            if (token.is_cancelled()) {
                return make_error<InstrumentAnalysis>(
                    ErrorCode::CANCELLED, "Analysis of " + instrument->get_symbol() + " cancelled",
                    "RsiAnalyzer");
            }
            return result;
        });
    }

    return gather_settled<InstrumentAnalysis>(
        pool_, std::move(tasks), std::chrono::milliseconds(config_.task_timeout_ms), "RsiAnalyzer");
}

Result<PortfolioSignals> RsiAnalyzer::portfolio_signals(
    const std::vector<std::shared_ptr<const Instrument>>& instruments,
    double min_confidence) const {
    if (!(min_confidence >= 0.0 && min_confidence <= 1.0)) {
        return make_error<PortfolioSignals>(ErrorCode::INVALID_ARGUMENT,
                                            "min_confidence must lie in [0, 1], got " +
                                                std::to_string(min_confidence),
                                            "RsiAnalyzer");
    }

    auto results = analyze_many(instruments);

    PortfolioSignals portfolio;
    portfolio.timestamp = std::chrono::system_clock::now();
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_error()) {
            ERROR("Failed to analyze " << instruments[i]->get_symbol() << ": "
                                       << results[i].error()->what());
            ++portfolio.failed;
            continue;
        }

        InstrumentAnalysis analysis = results[i].take_value();
        if (analysis.signal.confidence < min_confidence &&
            analysis.signal.action != SignalAction::HOLD) {
            continue;
        }

        portfolio.summary.totals.add(analysis.signal.action);
        portfolio.summary.by_category[instruments[i]->get_category()].add(analysis.signal.action);
        portfolio.signals.push_back(std::move(analysis));
    }

    INFO("Portfolio scan: " << portfolio.signals.size() << " signals retained, "
                            << portfolio.failed << " analyses failed");
    return portfolio;
}

Result<DivergenceAnalysis> RsiAnalyzer::analyze_divergence(const Instrument& instrument,
                                                           Interval interval,
                                                           size_t lookback) const {
    size_t count = std::max(lookback + kDivergenceExtraCandles, kDivergenceMinCandles);
    auto candles_result = candles_.get_candles(instrument.get_id(), interval, count);
    if (candles_result.is_error()) {
        return forward_error<DivergenceAnalysis>(candles_result, "RsiAnalyzer");
    }
    const std::vector<Candle>& candles = candles_result.value();

    RsiSeries rsi = RsiCalculator(kDivergenceRsiPeriod).series(candles);

    DivergenceAnalysis analysis;
    analysis.instrument = std::make_shared<const Instrument>(instrument);
    analysis.interval = interval;
    analysis.lookback = lookback;
    analysis.current_price = candles.back().close;
    analysis.current_rsi = RsiCalculator::latest(rsi);
    analysis.divergence = divergence_detector_.detect(rsi, candles, lookback);
    return analysis;
}

}  // namespace signal_ngin
