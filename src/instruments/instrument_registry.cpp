// src/instruments/instrument_registry.cpp
#include "signal_ngin/instruments/instrument_registry.hpp"
#include <algorithm>
#include <cctype>
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

nlohmann::json InstrumentSpec::to_json() const {
    return nlohmann::json{{"id", id},
                          {"symbol", symbol},
                          {"name", display_name},
                          {"category", category_to_string(category)},
                          {"description", description}};
}

Result<InstrumentSpec> InstrumentSpec::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("symbol")) {
        return make_error<InstrumentSpec>(ErrorCode::INVALID_ARGUMENT,
                                          "Instrument entry requires 'id' and 'symbol'",
                                          "InstrumentSpec");
    }

    InstrumentSpec spec;
    try {
        spec.id = j.at("id").get<std::string>();
        spec.symbol = j.at("symbol").get<std::string>();
        spec.display_name = j.value("name", spec.symbol);
        spec.description = j.value("description", std::string());
    } catch (const nlohmann::json::exception& e) {
        return make_error<InstrumentSpec>(ErrorCode::INVALID_ARGUMENT,
                                          std::string("Malformed instrument entry: ") + e.what(),
                                          "InstrumentSpec");
    }

    if (j.contains("category")) {
        auto category = parse_category(j.at("category").get<std::string>());
        if (category.is_error()) {
            return forward_error<InstrumentSpec>(category, "InstrumentSpec");
        }
        spec.category = category.value();
    }
    return spec;
}

std::vector<InstrumentSpec> InstrumentRegistry::default_universe() {
    using C = InstrumentCategory;
    return {
        {"3NZ9JMVBmGAqocybic2c7LQCJScmgsAZ6vQqTDzcqmJh", "WBTC", "Wrapped Bitcoin (Portal)",
         C::WRAPPED_BTC, "Wrapped Bitcoin on Solana via Portal Bridge"},
        {"cbbtcf3aa214zXHbiAZQwf4122FBYbraNdFqgw4iMij", "cbBTC", "Coinbase Wrapped BTC",
         C::WRAPPED_BTC, "Coinbase Wrapped Bitcoin on Solana"},
        {"zBTCug3er3tLyffELcvDNrKkCymbPWysGcWihESYfLg", "zBTC", "Zeus Bitcoin", C::WRAPPED_BTC,
         "Bitcoin on Solana via Zeus Network"},
        {"XsDoVfqeBukxuZHWhdvWHBhgEHjGNst4MLodqsJHzoB", "TSLAx", "Tesla xStock",
         C::TOKENIZED_STOCK, "Tokenized Tesla stock on Solana via xStocks"},
        {"XsbEhLAtcf6HdfpFZ5xEMdqW8nfAvcsP5bdudRLJzJp", "AAPLx", "Apple xStock",
         C::TOKENIZED_STOCK, "Tokenized Apple stock on Solana via xStocks"},
        {"XspzcW1PRtgf6Wj92HCiZdjzKCyFekVD8P5Ueh3dRMX", "MSFTx", "Microsoft xStock",
         C::TOKENIZED_STOCK, "Tokenized Microsoft stock on Solana via xStocks"},
        {"Xs3eBt7uRfJX8QUs4suhyU8p2M6DoUDrJyWBa8LLZsg", "AMZNx", "Amazon xStock",
         C::TOKENIZED_STOCK, "Tokenized Amazon stock on Solana via xStocks"},
        {"XsCPL9dNWBMvFtTmwcCA5v3xWPSMEBCszbQdiLLq6aN", "GOOGLx", "Alphabet xStock",
         C::TOKENIZED_STOCK, "Tokenized Alphabet stock on Solana via xStocks"},
        {"XsEH7wWfJJu2ZT3UCFeVfALnVA6CP5ur7Ee11KmzVpL", "NFLXx", "Netflix xStock",
         C::TOKENIZED_STOCK, "Tokenized Netflix stock on Solana via xStocks"},
        {"C6oFsE8nXRDThzrMEQ5SxaNFGKoyyfWDDVPw37JKvPTe", "PAXG", "Paxos Gold", C::GOLD_TOKEN,
         "Gold-backed token, 1 PAXG = 1 troy oz"},
        {"AymATz4TCL9sWNEEV9Kvyz45CHVhDZ6kUgjTJPzLpU9P", "XAUT", "Tether Gold", C::GOLD_TOKEN,
         "Gold-backed token by Tether, 1 XAUt = 1 troy oz"},
    };
}

std::string InstrumentRegistry::to_lower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

Result<void> InstrumentRegistry::load(const std::vector<InstrumentSpec>& specs) {
    std::vector<std::shared_ptr<const Instrument>> ordered;
    std::unordered_map<std::string, std::shared_ptr<const Instrument>> by_id;
    std::unordered_map<std::string, std::shared_ptr<const Instrument>> by_symbol;

    for (const auto& spec : specs) {
        if (spec.id.empty() || spec.symbol.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Instrument id and symbol cannot be empty",
                                    "InstrumentRegistry");
        }
        auto instrument = std::make_shared<const Instrument>(spec);
        if (!by_id.emplace(spec.id, instrument).second) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Duplicate instrument id: " + spec.id, "InstrumentRegistry");
        }
        if (!by_symbol.emplace(to_lower(spec.symbol), instrument).second) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Duplicate instrument symbol: " + spec.symbol,
                                    "InstrumentRegistry");
        }
        ordered.push_back(instrument);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ordered_ = std::move(ordered);
    by_id_ = std::move(by_id);
    by_symbol_ = std::move(by_symbol);

    INFO("Instrument registry loaded " << ordered_.size() << " instruments");
    return Result<void>();
}

Result<std::shared_ptr<const Instrument>> InstrumentRegistry::resolve(
    const std::string& id_or_symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = by_id_.find(id_or_symbol);
    if (it != by_id_.end()) {
        return it->second;
    }

    auto sym = by_symbol_.find(to_lower(id_or_symbol));
    if (sym != by_symbol_.end()) {
        return sym->second;
    }

    return make_error<std::shared_ptr<const Instrument>>(
        ErrorCode::INSTRUMENT_NOT_FOUND, "Unknown instrument: " + id_or_symbol,
        "InstrumentRegistry");
}

std::shared_ptr<const Instrument> InstrumentRegistry::get_instrument(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const Instrument>> InstrumentRegistry::get_all_instruments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

std::vector<std::shared_ptr<const Instrument>> InstrumentRegistry::get_instruments_by_category(
    InstrumentCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const Instrument>> result;
    for (const auto& instrument : ordered_) {
        if (instrument->get_category() == category) {
            result.push_back(instrument);
        }
    }
    return result;
}

bool InstrumentRegistry::has_instrument(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_id_.count(id) > 0;
}

size_t InstrumentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_.size();
}

}  // namespace signal_ngin
