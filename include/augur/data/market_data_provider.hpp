#pragma once
#include <augur/core/price_series.hpp>
#include <memory>
#include <string>

namespace augur::data {

// Source of OHLCV history. Implementations log their own failures and hand
// back an empty series instead of throwing.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    // period: 5d, 1wk, 1mo, 3mo, 6mo, 1y, 2y, 5y, ytd, max
    // interval: bar size such as 1d or 1h
    virtual core::PriceSeries get_series(const std::string& symbol,
                                         const std::string& period,
                                         const std::string& interval) = 0;
};

using MarketDataProviderPtr = std::shared_ptr<MarketDataProvider>;

} // namespace augur::data
