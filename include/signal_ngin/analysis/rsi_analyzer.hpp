// include/signal_ngin/analysis/rsi_analyzer.hpp
#pragma once

#include <map>
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
#include "signal_ngin/indicators/divergence.hpp"
#include "signal_ngin/indicators/rsi.hpp"
#include "signal_ngin/instruments/instrument.hpp"
#include "signal_ngin/strategy/signal_detector.hpp"

namespace signal_ngin {

/**
 * @brief Configuration for per-instrument and portfolio analysis
 */
struct AnalysisConfig : public ConfigBase {
    size_t candle_count{100};
    std::vector<Interval> mtf_intervals{Interval::MINUTE_5, Interval::HOUR_1, Interval::WEEK_1};
    size_t mtf_candle_count{50};
    int mtf_rsi_period{14};
    size_t divergence_lookback{10};
    size_t momentum_lookback{5};
    int64_t task_timeout_ms{15000};  // deadline of one analysis fan-out

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief RSI level relative to the category thresholds
 */
enum class RsiStatus { OVERSOLD, NEUTRAL, OVERBOUGHT };

std::string rsi_status_to_string(RsiStatus status);

struct TimeframeRsi {
    Interval interval{Interval::HOUR_1};
    double value{0.0};
    RsiStatus status{RsiStatus::NEUTRAL};
};

/**
 * @brief Complete RSI view of one instrument
 */
struct InstrumentAnalysis {
    std::shared_ptr<const Instrument> instrument;
    double current_price{0.0};
    double rsi_value{0.0};
    int rsi_period{14};
    Interval interval{Interval::HOUR_1};
    RsiStatus status{RsiStatus::NEUTRAL};
    SignalResult signal;
    DivergenceResult divergence;
    Momentum momentum{Momentum::NEUTRAL};
    std::vector<TimeframeRsi> multi_timeframe;
    Timestamp timestamp;

    nlohmann::json to_json() const;
};

/**
 * @brief Divergence scan of one instrument and interval
 */
struct DivergenceAnalysis {
    std::shared_ptr<const Instrument> instrument;
    Interval interval{Interval::HOUR_1};
    size_t lookback{10};
    double current_price{0.0};
    std::optional<double> current_rsi;
    DivergenceResult divergence;
};

struct ActionCounts {
    size_t buy{0};
    size_t sell{0};
    size_t hold{0};

    void add(SignalAction action);
    nlohmann::json to_json() const;
};

struct PortfolioSummary {
    ActionCounts totals;
    std::map<InstrumentCategory, ActionCounts> by_category;

    nlohmann::json to_json() const;
};

/**
 * @brief Retained analyses of a portfolio scan
 */
struct PortfolioSignals {
    Timestamp timestamp;
    std::vector<InstrumentAnalysis> signals;  // ordered as the input universe
    PortfolioSummary summary;
    size_t failed{0};
};

/**
 * @brief Runs the RSI pipeline over accumulated candles
 */
class RsiAnalyzer {
public:
    /**
     * @brief Constructor
     * @param config Candle counts, timeframes and deadlines
     * @param candles Candle store to read from
     * @param detector Signal rules
     * @param pool Pool running concurrent analyses
     */
    RsiAnalyzer(AnalysisConfig config, const CandleStore& candles, const SignalDetector& detector,
                WorkerPool& pool);

    virtual ~RsiAnalyzer() = default;

    /**
     * @brief Analyze one instrument
     * @param instrument Instrument to analyze
     * @param interval Candle interval, the category default when absent
     * @return INSUFFICIENT_DATA when no current RSI can be computed
     */
    virtual Result<InstrumentAnalysis> analyze_instrument(
        const Instrument& instrument, std::optional<Interval> interval = std::nullopt) const;

    /**
     * @brief Current RSI per interval; intervals without enough data are left out
     */
    std::vector<TimeframeRsi> multi_timeframe_rsi(const Instrument& instrument,
                                                  const std::vector<Interval>& intervals) const;

    /**
     * @brief Analyze instruments concurrently
     * @return One result per instrument, in input order
     */
    std::vector<Result<InstrumentAnalysis>> analyze_many(
        const std::vector<std::shared_ptr<const Instrument>>& instruments,
        std::optional<Interval> interval = std::nullopt) const;

    /**
     * @brief Portfolio-wide scan
     *
     * Failed analyses are logged and counted, never fatal. An analysis is
     * retained when its confidence reaches min_confidence or its action is HOLD.
     *
     * @return INVALID_ARGUMENT when min_confidence is outside [0, 1]
     */
    Result<PortfolioSignals> portfolio_signals(
        const std::vector<std::shared_ptr<const Instrument>>& instruments,
        double min_confidence) const;

    /**
     * @brief Divergence scan with a 14-period RSI
     * @return INSUFFICIENT_DATA when the series is empty or unknown
     */
    Result<DivergenceAnalysis> analyze_divergence(const Instrument& instrument, Interval interval,
                                                  size_t lookback) const;

    const AnalysisConfig& config() const {
        return config_;
    }

private:
    RsiStatus classify_status(double rsi, InstrumentCategory category) const;

    AnalysisConfig config_;
    const CandleStore& candles_;
    const SignalDetector& detector_;
    DivergenceDetector divergence_detector_;
    WorkerPool& pool_;
};

}  // namespace signal_ngin
