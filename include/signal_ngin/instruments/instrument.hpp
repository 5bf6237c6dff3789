// include/signal_ngin/instruments/instrument.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Static description of a tracked instrument as found in configuration
 */
struct InstrumentSpec {
    std::string id;  // token mint address
    std::string symbol;
    std::string display_name;
    InstrumentCategory category{InstrumentCategory::WRAPPED_BTC};
    std::string description;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a spec object
     * @return INVALID_ARGUMENT on missing id/symbol or unknown category
     */
    static Result<InstrumentSpec> from_json(const nlohmann::json& j);
};

/**
 * @brief Immutable tradable instrument
 */
class Instrument {
public:
    explicit Instrument(InstrumentSpec spec) : spec_(std::move(spec)) {}

    /**
     * @brief Canonical identifier, stable across restarts
     */
    const std::string& get_id() const {
        return spec_.id;
    }

    const std::string& get_symbol() const {
        return spec_.symbol;
    }

    const std::string& get_display_name() const {
        return spec_.display_name;
    }

    InstrumentCategory get_category() const {
        return spec_.category;
    }

    const std::string& get_description() const {
        return spec_.description;
    }

    const InstrumentSpec& get_spec() const {
        return spec_;
    }

    /**
     * @brief Summary used in operation payloads
     */
    nlohmann::json to_json() const {
        return spec_.to_json();
    }

private:
    InstrumentSpec spec_;
};

}  // namespace signal_ngin
