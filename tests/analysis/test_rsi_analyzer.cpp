#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "core/test_base.hpp"
#include "signal_ngin/analysis/rsi_analyzer.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

namespace {

std::shared_ptr<const Instrument> make_instrument(const std::string& symbol,
                                                  InstrumentCategory category) {
    return std::make_shared<const Instrument>(
        InstrumentSpec{"mint-" + symbol, symbol, symbol + " Token", category, ""});
}

std::vector<double> rising(size_t count) {
    std::vector<double> closes;
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(100.0 + static_cast<double>(i));
    }
    return closes;
}

// Two gains of 1.0 for every loss of 1.5 keeps RSI in the high 50s
std::vector<double> zigzag(size_t count) {
    std::vector<double> closes;
    double price = 100.0;
    for (size_t i = 0; i < count; ++i) {
        price += (i % 3 == 0) ? -1.5 : 1.0;
        closes.push_back(price);
    }
    return closes;
}

class FlakyAnalyzer : public RsiAnalyzer {
public:
    using RsiAnalyzer::RsiAnalyzer;

    Result<InstrumentAnalysis> analyze_instrument(
        const Instrument& instrument, std::optional<Interval> interval) const override {
        if (instrument.get_symbol() == "C") {
            throw std::runtime_error("corrupt series");
        }
        return RsiAnalyzer::analyze_instrument(instrument, interval);
    }
};

}  // namespace

class RsiAnalyzerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        CandleStoreConfig store_config;
        store_config.intervals = {Interval::MINUTE_5, Interval::HOUR_1, Interval::WEEK_1};
        store = std::make_unique<CandleStore>(store_config);
        pool = std::make_unique<WorkerPool>("AnalysisPool", 3);
        analyzer = std::make_unique<RsiAnalyzer>(AnalysisConfig(), *store, detector, *pool);
    }

    void TearDown() override {
        analyzer.reset();
        pool.reset();
        store.reset();
        TestBase::TearDown();
    }

    // One observation per hour, so 5m and 1h series both get one candle each
    void feed(const Instrument& instrument, const std::vector<double>& closes) {
        for (size_t i = 0; i < closes.size(); ++i) {
            ASSERT_TRUE(store->ingest(instrument.get_id(), closes[i],
                                      hours_from_epoch(static_cast<int64_t>(i)))
                            .is_ok());
        }
    }

    SignalDetector detector;
    std::unique_ptr<CandleStore> store;
    std::unique_ptr<WorkerPool> pool;
    std::unique_ptr<RsiAnalyzer> analyzer;
};

TEST_F(RsiAnalyzerTest, AnalyzesInstrumentOnCategoryInterval) {
    auto btc = make_instrument("WBTC", InstrumentCategory::WRAPPED_BTC);
    auto closes = zigzag(40);
    feed(*btc, closes);

    auto result = analyzer->analyze_instrument(*btc);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const InstrumentAnalysis& analysis = result.value();

    EXPECT_EQ(analysis.interval, Interval::HOUR_1);
    EXPECT_EQ(analysis.rsi_period, 14);
    EXPECT_DOUBLE_EQ(analysis.current_price, closes.back());
    EXPECT_GT(analysis.rsi_value, 40.0);
    EXPECT_LT(analysis.rsi_value, 70.0);
    EXPECT_EQ(analysis.status, RsiStatus::NEUTRAL);
    EXPECT_EQ(analysis.signal.action, SignalAction::HOLD);

    // The weekly series holds a single candle
    ASSERT_EQ(analysis.multi_timeframe.size(), 2u);
    EXPECT_EQ(analysis.multi_timeframe[0].interval, Interval::MINUTE_5);
    EXPECT_EQ(analysis.multi_timeframe[1].interval, Interval::HOUR_1);

    nlohmann::json j = analysis.to_json();
    EXPECT_EQ(j["rsi"]["interval"], "1h");
    EXPECT_EQ(j["rsi"]["status"], "neutral");
    EXPECT_TRUE(j["analysis"]["multi_timeframe"].contains("5m"));
    EXPECT_FALSE(j["analysis"]["multi_timeframe"].contains("1w"));
}

TEST_F(RsiAnalyzerTest, OverboughtInstrumentGetsSell) {
    auto stock = make_instrument("TSLAx", InstrumentCategory::TOKENIZED_STOCK);
    feed(*stock, rising(30));

    auto result = analyzer->analyze_instrument(*stock);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().interval, Interval::MINUTE_5);
    EXPECT_DOUBLE_EQ(result.value().rsi_value, 100.0);
    EXPECT_EQ(result.value().status, RsiStatus::OVERBOUGHT);
    EXPECT_EQ(result.value().signal.action, SignalAction::SELL);
    EXPECT_EQ(result.value().momentum, Momentum::STRONG);
}

TEST_F(RsiAnalyzerTest, ShortOrMissingSeriesIsInsufficientData) {
    auto gold = make_instrument("PAXG", InstrumentCategory::GOLD_TOKEN);
    feed(*gold, rising(10));

    auto short_series = analyzer->analyze_instrument(*gold);
    ASSERT_TRUE(short_series.is_error());
    EXPECT_EQ(short_series.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    auto unknown =
        analyzer->analyze_instrument(*make_instrument("ZZZ", InstrumentCategory::GOLD_TOKEN));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INSUFFICIENT_DATA);
    EXPECT_EQ(unknown.error()->component(), "RsiAnalyzer");

    auto explicit_interval = analyzer->analyze_instrument(*gold, Interval::WEEK_1);
    EXPECT_TRUE(explicit_interval.is_error());
}

TEST_F(RsiAnalyzerTest, AnalyzeManyKeepsOrderAndIsolatesFailures) {
    std::vector<std::shared_ptr<const Instrument>> universe{
        make_instrument("A", InstrumentCategory::WRAPPED_BTC),
        make_instrument("B", InstrumentCategory::WRAPPED_BTC),
        make_instrument("C", InstrumentCategory::GOLD_TOKEN)};
    feed(*universe[0], zigzag(40));
    feed(*universe[2], rising(40));

    auto results = analyzer->analyze_many(universe, Interval::HOUR_1);
    ASSERT_EQ(results.size(), 3u);
    ASSERT_TRUE(results[0].is_ok());
    EXPECT_EQ(results[0].value().instrument->get_symbol(), "A");
    ASSERT_TRUE(results[1].is_error());
    EXPECT_EQ(results[1].error()->code(), ErrorCode::INSUFFICIENT_DATA);
    ASSERT_TRUE(results[2].is_ok());
    EXPECT_EQ(results[2].value().instrument->get_symbol(), "C");
}

TEST_F(RsiAnalyzerTest, PortfolioScanSurvivesOneFailure) {
    FlakyAnalyzer flaky(AnalysisConfig(), *store, detector, *pool);

    std::vector<std::shared_ptr<const Instrument>> universe;
    for (const char* symbol : {"A", "B", "C", "D", "E"}) {
        universe.push_back(make_instrument(symbol, InstrumentCategory::WRAPPED_BTC));
        feed(*universe.back(), rising(30));
    }

    auto result = flaky.portfolio_signals(universe, 0.6);
    ASSERT_TRUE(result.is_ok());
    const PortfolioSignals& portfolio = result.value();

    EXPECT_EQ(portfolio.failed, 1u);
    ASSERT_EQ(portfolio.signals.size(), 4u);
    std::vector<std::string> symbols;
    for (const auto& analysis : portfolio.signals) {
        symbols.push_back(analysis.instrument->get_symbol());
        EXPECT_EQ(analysis.signal.action, SignalAction::SELL);
    }
    EXPECT_EQ(symbols, (std::vector<std::string>{"A", "B", "D", "E"}));
    EXPECT_EQ(portfolio.summary.totals.sell, 4u);
    EXPECT_EQ(portfolio.summary.by_category.at(InstrumentCategory::WRAPPED_BTC).sell, 4u);
}

TEST_F(RsiAnalyzerTest, PortfolioFilterKeepsHolds) {
    auto overbought = make_instrument("HOT", InstrumentCategory::WRAPPED_BTC);
    auto calm = make_instrument("CALM", InstrumentCategory::WRAPPED_BTC);
    feed(*overbought, rising(30));
    feed(*calm, zigzag(30));

    auto result = analyzer->portfolio_signals({overbought, calm}, 0.7);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().signals.size(), 1u);
    EXPECT_EQ(result.value().signals[0].instrument->get_symbol(), "CALM");
    EXPECT_EQ(result.value().summary.totals.hold, 1u);
    EXPECT_EQ(result.value().summary.totals.sell, 0u);

    auto invalid = analyzer->portfolio_signals({calm}, 1.5);
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RsiAnalyzerTest, DivergenceScanReportsCurrentRsi) {
    auto btc = make_instrument("WBTC", InstrumentCategory::WRAPPED_BTC);
    feed(*btc, rising(60));

    auto result = analyzer->analyze_divergence(*btc, Interval::HOUR_1, 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().lookback, 10u);
    EXPECT_DOUBLE_EQ(result.value().current_price, 159.0);
    ASSERT_TRUE(result.value().current_rsi.has_value());
    EXPECT_DOUBLE_EQ(*result.value().current_rsi, 100.0);
    EXPECT_FALSE(result.value().divergence.any());

    auto missing = analyzer->analyze_divergence(*btc, Interval::MINUTE_1, 10);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}
