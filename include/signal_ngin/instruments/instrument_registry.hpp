// include/signal_ngin/instruments/instrument_registry.hpp
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/instruments/instrument.hpp"

namespace signal_ngin {

/**
 * @brief Registry of the tracked instrument universe
 *
 * Loaded once at startup. Lookups accept the canonical id or the symbol
 * (case-insensitive); insertion order is preserved for listings.
 */
class InstrumentRegistry {
public:
    InstrumentRegistry() = default;

    InstrumentRegistry(const InstrumentRegistry&) = delete;
    InstrumentRegistry& operator=(const InstrumentRegistry&) = delete;

    /**
     * @brief Built-in universe of wrapped BTC, tokenized stocks and gold tokens
     */
    static std::vector<InstrumentSpec> default_universe();

    /**
     * @brief Replace the registry contents
     * @param specs Instrument descriptions, ids and symbols must be unique
     * @return INVALID_ARGUMENT on empty or duplicate ids/symbols
     */
    Result<void> load(const std::vector<InstrumentSpec>& specs);

    /**
     * @brief Resolve an id or symbol to an instrument
     * @return INSTRUMENT_NOT_FOUND if neither matches
     */
    Result<std::shared_ptr<const Instrument>> resolve(const std::string& id_or_symbol) const;

    /**
     * @brief Get instrument by canonical id
     * @return nullptr if not found
     */
    std::shared_ptr<const Instrument> get_instrument(const std::string& id) const;

    /**
     * @brief All instruments in load order
     */
    std::vector<std::shared_ptr<const Instrument>> get_all_instruments() const;

    std::vector<std::shared_ptr<const Instrument>> get_instruments_by_category(
        InstrumentCategory category) const;

    bool has_instrument(const std::string& id) const;

    size_t size() const;

private:
    static std::string to_lower(const std::string& text);

    std::vector<std::shared_ptr<const Instrument>> ordered_;
    std::unordered_map<std::string, std::shared_ptr<const Instrument>> by_id_;
    std::unordered_map<std::string, std::shared_ptr<const Instrument>> by_symbol_;
    mutable std::mutex mutex_;
};

}  // namespace signal_ngin
