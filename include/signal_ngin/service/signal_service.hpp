// include/signal_ngin/service/signal_service.hpp
#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/service/payment_gate.hpp"
#include "signal_ngin/service/signal_engine.hpp"

namespace signal_ngin {

enum class ResponseStatus { OK, PAYMENT_REQUIRED, FAILED };

/**
 * @brief Wire form of a status: "success", "payment_required" or "error"
 */
std::string response_status_to_string(ResponseStatus status);

/**
 * @brief Outcome of one operation call
 */
struct OperationResponse {
    ResponseStatus status{ResponseStatus::OK};
    std::string error_kind;  // error_code_to_string of the failure, FAILED only
    std::string message;
    nlohmann::json payload = nlohmann::json::object();

    /**
     * @brief Flatten into {"status", ...payload} or {"status", "kind", "message"}
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Request handling layer over a running engine
 *
 * Every operation consults the payment gate before its handler runs. Handler
 * failures are reported with their machine-readable error kind.
 */
class SignalService {
public:
    explicit SignalService(SignalEngine& engine);

    /**
     * @brief Names of all exposed operations
     */
    static const std::vector<std::string>& operations();

    /**
     * @brief Execute one operation
     * @param operation Operation name, e.g. "get-rsi-analysis"
     * @param arguments JSON object of operation arguments
     * @param context Caller headers and session
     */
    OperationResponse handle(const std::string& operation, const nlohmann::json& arguments,
                             const RequestContext& context);

    /**
     * @brief Execute a request envelope {"id", "operation", "arguments", "headers", "session_id"}
     * @return Response envelope carrying the request id
     */
    nlohmann::json handle_request(const nlohmann::json& request);

private:
    using Handler = std::function<Result<nlohmann::json>(const nlohmann::json&)>;

    OperationResponse payment_required(const std::string& operation,
                                       const Authorization& authorization) const;

    Result<nlohmann::json> get_current_prices(const nlohmann::json& args);
    Result<nlohmann::json> get_ohlc_data(const nlohmann::json& args);
    Result<nlohmann::json> get_ohlc_stats(const nlohmann::json& args);
    Result<nlohmann::json> get_rsi_analysis(const nlohmann::json& args);
    Result<nlohmann::json> get_rsi_divergence(const nlohmann::json& args);
    Result<nlohmann::json> get_portfolio_signals(const nlohmann::json& args);

    SignalEngine& engine_;
    std::map<std::string, Handler> handlers_;
};

}  // namespace signal_ngin
