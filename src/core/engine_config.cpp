// src/core/engine_config.cpp

#include "signal_ngin/core/engine_config.hpp"

#include <fstream>

#include "signal_ngin/core/env_loader.hpp"

namespace signal_ngin {

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["candles"] = candles.to_json();
    j["quotes"] = quotes.to_json();
    j["feed"] = feed.to_json();
    j["poller"] = poller.to_json();
    j["policy"] = policy.to_json();
    j["analysis"] = analysis.to_json();
    j["payments"] = payments.to_json();

    nlohmann::json specs = nlohmann::json::array();
    for (const auto& spec : instruments) {
        specs.push_back(spec.to_json());
    }
    j["instruments"] = specs;
    j["fetch_threads"] = fetch_threads;
    j["analysis_threads"] = analysis_threads;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("candles"))
        candles.from_json(j.at("candles"));
    if (j.contains("quotes"))
        quotes.from_json(j.at("quotes"));
    if (j.contains("feed"))
        feed.from_json(j.at("feed"));
    if (j.contains("poller"))
        poller.from_json(j.at("poller"));
    if (j.contains("policy"))
        policy.from_json(j.at("policy"));
    if (j.contains("analysis"))
        analysis.from_json(j.at("analysis"));
    if (j.contains("payments"))
        payments.from_json(j.at("payments"));
    if (j.contains("instruments")) {
        instruments.clear();
        for (const auto& item : j.at("instruments")) {
            auto spec = InstrumentSpec::from_json(item);
            if (spec.is_error()) {
                throw *spec.error();
            }
            instruments.push_back(spec.take_value());
        }
    }
    if (j.contains("fetch_threads"))
        fetch_threads = j.at("fetch_threads").get<size_t>();
    if (j.contains("analysis_threads"))
        analysis_threads = j.at("analysis_threads").get<size_t>();
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    }
}

Result<void> ConfigLoader::apply_env_overrides(EngineConfig& config) {
    auto cache_ttl = EnvLoader::get_int("CACHE_TTL");
    if (cache_ttl.is_error()) {
        return forward_error<void>(cache_ttl, "ConfigLoader");
    }
    if (cache_ttl.value()) {
        config.quotes.cache.ttl_ms = *cache_ttl.value();
    }

    auto max_candles = EnvLoader::get_int("MAX_CANDLES");
    if (max_candles.is_error()) {
        return forward_error<void>(max_candles, "ConfigLoader");
    }
    if (max_candles.value()) {
        config.candles.max_candles = static_cast<size_t>(*max_candles.value());
    }

    auto poll_interval = EnvLoader::get_int("POLL_INTERVAL_MS");
    if (poll_interval.is_error()) {
        return forward_error<void>(poll_interval, "ConfigLoader");
    }
    if (poll_interval.value()) {
        config.poller.interval_ms = *poll_interval.value();
    }

    if (auto url = EnvLoader::get("JUPITER_PRICE_API_URL")) {
        config.feed.base_url = *url;
    }
    if (auto enabled = EnvLoader::get_bool("X402_PAYMENT_ENABLED")) {
        config.payments.enabled = *enabled;
    }
    if (auto facilitator = EnvLoader::get("X402_FACILITATOR_URL")) {
        config.payments.facilitator_url = *facilitator;
    }
    return Result<void>();
}

Result<EngineConfig> ConfigLoader::load(const std::filesystem::path& config_file) {
    EngineConfig config;

    if (!config_file.empty()) {
        auto file_json = load_json_file(config_file);
        if (file_json.is_error()) {
            return forward_error<EngineConfig>(file_json, "ConfigLoader");
        }
        auto applied = config.apply_overrides(file_json.value());
        if (applied.is_error()) {
            return forward_error<EngineConfig>(applied, "ConfigLoader");
        }
    }

    auto env_result = apply_env_overrides(config);
    if (env_result.is_error()) {
        return forward_error<EngineConfig>(env_result, "ConfigLoader");
    }

    auto policy_result = config.policy.validate();
    if (policy_result.is_error()) {
        return forward_error<EngineConfig>(policy_result, "ConfigLoader");
    }
    if (config.candles.max_candles == 0) {
        return make_error<EngineConfig>(ErrorCode::INVALID_ARGUMENT,
                                        "candles.max_candles must be positive", "ConfigLoader");
    }
    if (config.fetch_threads == 0 || config.analysis_threads == 0) {
        return make_error<EngineConfig>(ErrorCode::INVALID_ARGUMENT,
                                        "Thread counts must be positive", "ConfigLoader");
    }
    return config;
}

}  // namespace signal_ngin
