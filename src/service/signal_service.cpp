// src/service/signal_service.cpp

#include "signal_ngin/service/signal_service.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>

#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/indicators/price_statistics.hpp"

namespace signal_ngin {

namespace {

constexpr const char* kComponent = "SignalService";

constexpr size_t kDefaultCandleCount = 100;
constexpr size_t kMaxCandleCount = 1000;
constexpr size_t kDefaultLookback = 10;
constexpr size_t kMinLookback = 5;
constexpr size_t kMaxLookback = 50;
constexpr double kDefaultMinConfidence = 0.6;
constexpr double kStrongBuyConfidence = 0.8;

double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

Result<std::optional<std::string>> optional_string(const nlohmann::json& args,
                                                   const std::string& key) {
    if (!args.contains(key) || args.at(key).is_null()) {
        return std::optional<std::string>();
    }
    if (!args.at(key).is_string()) {
        return make_error<std::optional<std::string>>(ErrorCode::INVALID_ARGUMENT,
                                                      "Argument " + key + " must be a string",
                                                      kComponent);
    }
    return std::optional<std::string>(args.at(key).get<std::string>());
}

Result<std::string> required_string(const nlohmann::json& args, const std::string& key) {
    auto value = optional_string(args, key);
    if (value.is_error()) {
        return forward_error<std::string>(value, kComponent);
    }
    if (!value.value() || value.value()->empty()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Missing required argument: " + key, kComponent);
    }
    return *value.value();
}

Result<size_t> bounded_count(const nlohmann::json& args, const std::string& key,
                             size_t default_value, size_t min_value, size_t max_value) {
    if (!args.contains(key) || args.at(key).is_null()) {
        return default_value;
    }
    const auto& raw = args.at(key);
    if (!raw.is_number_integer()) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT,
                                  "Argument " + key + " must be an integer", kComponent);
    }
    int64_t value = raw.get<int64_t>();
    if (value < static_cast<int64_t>(min_value) || value > static_cast<int64_t>(max_value)) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT,
                                  "Argument " + key + " must be between " +
                                      std::to_string(min_value) + " and " +
                                      std::to_string(max_value),
                                  kComponent);
    }
    return static_cast<size_t>(value);
}

Result<std::optional<Interval>> optional_interval(const nlohmann::json& args) {
    auto text = optional_string(args, "interval");
    if (text.is_error()) {
        return forward_error<std::optional<Interval>>(text, kComponent);
    }
    if (!text.value()) {
        return std::optional<Interval>();
    }
    auto interval = parse_interval(*text.value());
    if (interval.is_error()) {
        return forward_error<std::optional<Interval>>(interval, kComponent);
    }
    return std::optional<Interval>(interval.value());
}

nlohmann::json instrument_summary(const Instrument& instrument) {
    return nlohmann::json{{"id", instrument.get_id()},
                          {"symbol", instrument.get_symbol()},
                          {"name", instrument.get_display_name()},
                          {"category", category_to_string(instrument.get_category())}};
}

nlohmann::json candle_to_json(const Candle& candle) {
    nlohmann::json j{{"timestamp", core::to_iso8601(candle.bucket_start)},
                     {"open", candle.open},
                     {"high", candle.high},
                     {"low", candle.low},
                     {"close", candle.close}};
    j["volume"] = candle.volume ? nlohmann::json(*candle.volume) : nlohmann::json(nullptr);
    return j;
}

std::string divergence_interpretation(const DivergenceResult& divergence) {
    if (divergence.bullish) {
        return "Bullish divergence detected - potential reversal to upside";
    }
    if (divergence.bearish) {
        return "Bearish divergence detected - potential reversal to downside";
    }
    return "No divergence detected";
}

std::string trading_implication(const DivergenceResult& divergence) {
    if (divergence.bullish) {
        return "Consider LONG positions - price may reverse upward";
    }
    if (divergence.bearish) {
        return "Consider closing LONG positions or SHORTING - price may reverse downward";
    }
    return "No clear divergence signal - use other indicators";
}

}  // namespace

std::string response_status_to_string(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::OK:
            return "success";
        case ResponseStatus::PAYMENT_REQUIRED:
            return "payment_required";
        case ResponseStatus::FAILED:
            return "error";
    }
    return "error";
}

nlohmann::json OperationResponse::to_json() const {
    nlohmann::json j = payload.is_object() ? payload : nlohmann::json::object();
    j["status"] = response_status_to_string(status);
    if (status == ResponseStatus::FAILED) {
        j["kind"] = error_kind;
        j["message"] = message;
    } else if (!message.empty()) {
        j["message"] = message;
    }
    return j;
}

SignalService::SignalService(SignalEngine& engine) : engine_(engine) {
    handlers_["get-current-prices"] = [this](const nlohmann::json& a) {
        return get_current_prices(a);
    };
    handlers_["get-ohlc-data"] = [this](const nlohmann::json& a) { return get_ohlc_data(a); };
    handlers_["get-ohlc-stats"] = [this](const nlohmann::json& a) { return get_ohlc_stats(a); };
    handlers_["get-rsi-analysis"] = [this](const nlohmann::json& a) {
        return get_rsi_analysis(a);
    };
    handlers_["get-rsi-divergence"] = [this](const nlohmann::json& a) {
        return get_rsi_divergence(a);
    };
    handlers_["get-portfolio-signals"] = [this](const nlohmann::json& a) {
        return get_portfolio_signals(a);
    };
}

const std::vector<std::string>& SignalService::operations() {
    static const std::vector<std::string> names{
        "get-current-prices", "get-ohlc-data",      "get-ohlc-stats",
        "get-rsi-analysis",   "get-rsi-divergence", "get-portfolio-signals"};
    return names;
}

OperationResponse SignalService::handle(const std::string& operation,
                                        const nlohmann::json& arguments,
                                        const RequestContext& context) {
    Logger::register_component(kComponent);
    OperationResponse response;

    auto handler = handlers_.find(operation);
    if (handler == handlers_.end()) {
        response.status = ResponseStatus::FAILED;
        response.error_kind = error_code_to_string(ErrorCode::INVALID_ARGUMENT);
        response.message = "Unknown operation: " + operation;
        return response;
    }

    if (!engine_.is_initialized()) {
        response.status = ResponseStatus::FAILED;
        response.error_kind = error_code_to_string(ErrorCode::NOT_INITIALIZED);
        response.message = "Signal engine not initialized";
        return response;
    }

    Authorization authorization = engine_.gate().authorize(operation, context);
    if (!authorization.granted) {
        INFO("Denied " << operation << ": " << authorization.reason);
        return payment_required(operation, authorization);
    }

    const nlohmann::json& args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        response.status = ResponseStatus::FAILED;
        response.error_kind = error_code_to_string(ErrorCode::INVALID_ARGUMENT);
        response.message = "Arguments must be a JSON object";
        return response;
    }

    Result<nlohmann::json> result = [&]() -> Result<nlohmann::json> {
        try {
            return handler->second(args);
        } catch (const nlohmann::json::exception& e) {
            return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                              std::string("Malformed arguments: ") + e.what(),
                                              kComponent);
        } catch (const std::exception& e) {
            return make_error<nlohmann::json>(ErrorCode::UNKNOWN_ERROR, e.what(), kComponent);
        }
    }();

    if (result.is_error()) {
        WARN(operation << " failed: " << result.error()->to_string());
        response.status = ResponseStatus::FAILED;
        response.error_kind = result.error()->kind();
        response.message = result.error()->what();
        return response;
    }

    response.payload = result.take_value();
    response.payload["timestamp"] = core::to_iso8601(std::chrono::system_clock::now());
    return response;
}

nlohmann::json SignalService::handle_request(const nlohmann::json& request) {
    nlohmann::json id = request.is_object() && request.contains("id") ? request.at("id")
                                                                       : nlohmann::json(nullptr);

    if (!request.is_object() || !request.contains("operation") ||
        !request.at("operation").is_string()) {
        OperationResponse invalid;
        invalid.status = ResponseStatus::FAILED;
        invalid.error_kind = error_code_to_string(ErrorCode::INVALID_ARGUMENT);
        invalid.message = "Request must carry a string \"operation\"";
        nlohmann::json out = invalid.to_json();
        out["id"] = id;
        return out;
    }

    RequestContext context;
    if (request.contains("headers") && request.at("headers").is_object()) {
        for (auto it = request.at("headers").begin(); it != request.at("headers").end(); ++it) {
            if (it.value().is_string()) {
                context.headers[it.key()] = it.value().get<std::string>();
            }
        }
    }
    if (request.contains("session_id") && request.at("session_id").is_string()) {
        context.session_id = request.at("session_id").get<std::string>();
    }

    nlohmann::json arguments =
        request.contains("arguments") ? request.at("arguments") : nlohmann::json::object();

    nlohmann::json out =
        handle(request.at("operation").get<std::string>(), arguments, context).to_json();
    out["id"] = id;
    return out;
}

OperationResponse SignalService::payment_required(const std::string& operation,
                                                  const Authorization& authorization) const {
    OperationResponse response;
    response.status = ResponseStatus::PAYMENT_REQUIRED;
    response.message = authorization.reason;

    nlohmann::json pricing(nullptr);
    if (auto price = engine_.config().payments.price_of(operation)) {
        pricing = nlohmann::json{{"amount", price->amount},
                                 {"formatted", price->formatted()},
                                 {"description", price->description}};
    }

    response.payload = nlohmann::json{
        {"operation", operation},
        {"reason", authorization.reason},
        {"pricing", pricing},
        {"instructions",
         {{"protocol", "x402"},
          {"steps",
           {"1. Create a signed transaction for the required amount",
            "2. Submit transaction to facilitator",
            "3. Include X-PAYMENT header with payment proof",
            "4. Retry the tool request with payment header"}},
          {"documentation", "https://docs.payai.network/x402"}}}};
    return response;
}

Result<nlohmann::json> SignalService::get_current_prices(const nlohmann::json& args) {
    auto category_text = optional_string(args, "category");
    if (category_text.is_error()) {
        return forward_error<nlohmann::json>(category_text, kComponent);
    }

    std::optional<InstrumentCategory> category;
    if (category_text.value()) {
        auto parsed = parse_category(*category_text.value());
        if (parsed.is_error()) {
            return forward_error<nlohmann::json>(parsed, kComponent);
        }
        category = parsed.value();
    }

    auto quotes = engine_.quotes().get_current_prices(category);
    if (quotes.is_error()) {
        return forward_error<nlohmann::json>(quotes, kComponent);
    }

    nlohmann::json prices = nlohmann::json::array();
    double sum = 0.0;
    double min_price = 0.0;
    double max_price = 0.0;
    for (const auto& quote : quotes.value()) {
        nlohmann::json entry;
        if (auto instrument = engine_.registry().get_instrument(quote.instrument_id)) {
            entry = instrument_summary(*instrument);
        } else {
            entry["id"] = quote.instrument_id;
        }
        entry["price"] = quote.price;
        entry["priceChange24h"] = quote.price_change_24h ? nlohmann::json(*quote.price_change_24h)
                                                         : nlohmann::json(nullptr);
        entry["timestamp"] = core::to_iso8601(quote.timestamp);
        entry["source"] = quote.source;
        prices.push_back(entry);

        if (prices.size() == 1) {
            min_price = quote.price;
            max_price = quote.price;
        }
        min_price = std::min(min_price, quote.price);
        max_price = std::max(max_price, quote.price);
        sum += quote.price;
    }

    const size_t total = quotes.value().size();
    return nlohmann::json{
        {"category", category ? category_to_string(*category) : std::string("all")},
        {"totalAssets", total},
        {"prices", prices},
        {"summary",
         {{"avgPrice", total > 0 ? sum / static_cast<double>(total) : 0.0},
          {"priceRange", {{"min", min_price}, {"max", max_price}}}}}};
}

Result<nlohmann::json> SignalService::get_ohlc_data(const nlohmann::json& args) {
    auto asset = required_string(args, "asset");
    if (asset.is_error()) {
        return forward_error<nlohmann::json>(asset, kComponent);
    }
    auto interval_text = required_string(args, "interval");
    if (interval_text.is_error()) {
        return forward_error<nlohmann::json>(interval_text, kComponent);
    }
    auto interval = parse_interval(interval_text.value());
    if (interval.is_error()) {
        return forward_error<nlohmann::json>(interval, kComponent);
    }
    auto count = bounded_count(args, "count", kDefaultCandleCount, 1, kMaxCandleCount);
    if (count.is_error()) {
        return forward_error<nlohmann::json>(count, kComponent);
    }

    auto instrument = engine_.registry().resolve(asset.value());
    if (instrument.is_error()) {
        return forward_error<nlohmann::json>(instrument, kComponent);
    }
    const auto& inst = *instrument.value();

    auto candles = engine_.candles().get_candles(inst.get_id(), interval.value(), count.value());
    if (candles.is_error()) {
        return forward_error<nlohmann::json>(candles, kComponent);
    }
    auto statistics = compute_price_statistics(candles.value());
    if (statistics.is_error()) {
        return forward_error<nlohmann::json>(statistics, kComponent);
    }

    nlohmann::json data = nlohmann::json::array();
    for (const auto& candle : candles.value()) {
        data.push_back(candle_to_json(candle));
    }

    return nlohmann::json{
        {"asset", instrument_summary(inst)},
        {"interval", interval_to_string(interval.value())},
        {"requestedCount", count.value()},
        {"actualCount", candles.value().size()},
        {"data", data},
        {"statistics", statistics.value().to_json()},
        {"timeRange",
         {{"start", core::to_iso8601(candles.value().front().bucket_start)},
          {"end", core::to_iso8601(candles.value().back().bucket_start)}}}};
}

Result<nlohmann::json> SignalService::get_ohlc_stats(const nlohmann::json& /*args*/) {
    nlohmann::json candle_stats = nlohmann::json::object();
    std::set<std::string> instruments;

    for (const auto& stats : engine_.candles().get_stats()) {
        std::string key = stats.instrument_id;
        if (auto instrument = engine_.registry().get_instrument(stats.instrument_id)) {
            key = instrument->get_symbol();
        }
        candle_stats[key][interval_to_string(stats.interval)] = stats.candle_count;
        instruments.insert(stats.instrument_id);
    }

    return nlohmann::json{{"totalAssets", instruments.size()}, {"candleStats", candle_stats}};
}

Result<nlohmann::json> SignalService::get_rsi_analysis(const nlohmann::json& args) {
    auto asset = optional_string(args, "asset");
    if (asset.is_error()) {
        return forward_error<nlohmann::json>(asset, kComponent);
    }
    auto category_text = optional_string(args, "category");
    if (category_text.is_error()) {
        return forward_error<nlohmann::json>(category_text, kComponent);
    }
    auto interval = optional_interval(args);
    if (interval.is_error()) {
        return forward_error<nlohmann::json>(interval, kComponent);
    }

    std::vector<std::shared_ptr<const Instrument>> targets;
    std::string filter = "all assets";
    if (asset.value()) {
        auto instrument = engine_.registry().resolve(*asset.value());
        if (instrument.is_error()) {
            return forward_error<nlohmann::json>(instrument, kComponent);
        }
        targets.push_back(instrument.value());
        filter = "asset: " + *asset.value();
    } else if (category_text.value()) {
        auto category = parse_category(*category_text.value());
        if (category.is_error()) {
            return forward_error<nlohmann::json>(category, kComponent);
        }
        targets = engine_.registry().get_instruments_by_category(category.value());
        filter = "category: " + *category_text.value();
    } else {
        targets = engine_.registry().get_all_instruments();
    }

    auto results = engine_.analyzer().analyze_many(targets, interval.value());

    nlohmann::json analyses = nlohmann::json::array();
    ActionCounts counts;
    double confidence_sum = 0.0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_error()) {
            WARN("Failed to analyze " << targets[i]->get_symbol() << ": "
                                      << results[i].error()->what());
            continue;
        }
        const auto& analysis = results[i].value();
        analyses.push_back(analysis.to_json());
        counts.add(analysis.signal.action);
        confidence_sum += analysis.signal.confidence;
    }

    if (analyses.empty()) {
        return make_error<nlohmann::json>(
            ErrorCode::INSUFFICIENT_DATA,
            "No RSI analysis available. Ensure sufficient OHLC data has been collected.",
            kComponent);
    }

    return nlohmann::json{
        {"totalAnalyzed", analyses.size()},
        {"filter", filter},
        {"analyses", analyses},
        {"summary",
         {{"buySignals", counts.buy},
          {"sellSignals", counts.sell},
          {"holdSignals", counts.hold},
          {"avgConfidence",
           round_to(confidence_sum / static_cast<double>(analyses.size()), 2)}}}};
}

Result<nlohmann::json> SignalService::get_rsi_divergence(const nlohmann::json& args) {
    auto asset = required_string(args, "asset");
    if (asset.is_error()) {
        return forward_error<nlohmann::json>(asset, kComponent);
    }
    auto interval_text = required_string(args, "interval");
    if (interval_text.is_error()) {
        return forward_error<nlohmann::json>(interval_text, kComponent);
    }
    auto interval = parse_interval(interval_text.value());
    if (interval.is_error()) {
        return forward_error<nlohmann::json>(interval, kComponent);
    }
    auto lookback = bounded_count(args, "lookback", kDefaultLookback, kMinLookback, kMaxLookback);
    if (lookback.is_error()) {
        return forward_error<nlohmann::json>(lookback, kComponent);
    }

    auto instrument = engine_.registry().resolve(asset.value());
    if (instrument.is_error()) {
        return forward_error<nlohmann::json>(instrument, kComponent);
    }

    auto scan = engine_.analyzer().analyze_divergence(*instrument.value(), interval.value(),
                                                      lookback.value());
    if (scan.is_error()) {
        return forward_error<nlohmann::json>(scan, kComponent);
    }
    const auto& result = scan.value();

    nlohmann::json asset_json = instrument_summary(*instrument.value());
    asset_json["currentPrice"] = result.current_price;

    nlohmann::json divergence = result.divergence.to_json();
    divergence["interpretation"] = divergence_interpretation(result.divergence);

    return nlohmann::json{
        {"asset", asset_json},
        {"interval", interval_to_string(result.interval)},
        {"lookback", result.lookback},
        {"currentRSI", result.current_rsi ? nlohmann::json(round_to(*result.current_rsi, 2))
                                          : nlohmann::json(nullptr)},
        {"divergence", divergence},
        {"tradingImplication", trading_implication(result.divergence)}};
}

Result<nlohmann::json> SignalService::get_portfolio_signals(const nlohmann::json& args) {
    double min_confidence = kDefaultMinConfidence;
    if (args.contains("minConfidence") && !args.at("minConfidence").is_null()) {
        if (!args.at("minConfidence").is_number()) {
            return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                              "Argument minConfidence must be a number",
                                              kComponent);
        }
        min_confidence = args.at("minConfidence").get<double>();
    }

    auto instruments = engine_.registry().get_all_instruments();
    auto portfolio = engine_.analyzer().portfolio_signals(instruments, min_confidence);
    if (portfolio.is_error()) {
        return forward_error<nlohmann::json>(portfolio, kComponent);
    }
    const auto& scan = portfolio.value();

    nlohmann::json signals = nlohmann::json::array();
    nlohmann::json strong_buys = nlohmann::json::array();
    nlohmann::json moderate_buys = nlohmann::json::array();
    nlohmann::json sells = nlohmann::json::array();
    for (const auto& analysis : scan.signals) {
        nlohmann::json entry = analysis.to_json();
        signals.push_back(entry);

        const auto& signal = analysis.signal;
        if (signal.action == SignalAction::BUY && signal.confidence >= kStrongBuyConfidence) {
            strong_buys.push_back(entry);
        } else if (signal.action == SignalAction::BUY &&
                   signal.confidence >= kDefaultMinConfidence) {
            moderate_buys.push_back(entry);
        } else if (signal.action == SignalAction::SELL) {
            sells.push_back(entry);
        }
    }

    return nlohmann::json{
        {"minConfidence", min_confidence},
        {"totalAssets", instruments.size()},
        {"totalSignals", scan.signals.size()},
        {"failed", scan.failed},
        {"summary", scan.summary.to_json()},
        {"signals", signals},
        {"actionableSignals",
         {{"strongBuys", strong_buys}, {"moderateBuys", moderate_buys}, {"sells", sells}}},
        {"scannedAt", core::to_iso8601(scan.timestamp)}};
}

}  // namespace signal_ngin
