// include/signal_ngin/data/price_feed.hpp
#pragma once

#include <string>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/instruments/instrument.hpp"

namespace signal_ngin {

/**
 * @brief Source of spot prices for tracked instruments
 */
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    /**
     * @brief Fetch the current price of an instrument
     * @return UPSTREAM_FETCH_ERROR when no usable price is available
     */
    virtual Result<PriceQuote> fetch_price(const Instrument& instrument) = 0;

    /**
     * @brief Source tag stored on produced quotes
     */
    virtual std::string name() const = 0;
};

}  // namespace signal_ngin
