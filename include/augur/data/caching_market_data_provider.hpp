#pragma once
#include <augur/data/market_data_provider.hpp>
#include <augur/data/timed_cache.hpp>
#include <memory>
#include <string>

namespace augur::data {

using SeriesCache = TimedCache<std::string, core::PriceSeries>;

// Serves repeated requests for the same symbol/period/interval from a
// TimedCache. Empty results always go back to the upstream provider.
class CachingMarketDataProvider : public MarketDataProvider {
public:
    static constexpr std::chrono::seconds DEFAULT_TTL{300};

    CachingMarketDataProvider(MarketDataProviderPtr upstream, std::shared_ptr<SeriesCache> cache);

    core::PriceSeries get_series(const std::string& symbol,
                                 const std::string& period,
                                 const std::string& interval) override;

    static std::string cache_key(const std::string& symbol,
                                 const std::string& period,
                                 const std::string& interval);

    const std::shared_ptr<SeriesCache>& cache() const { return cache_; }

private:
    MarketDataProviderPtr upstream_;
    std::shared_ptr<SeriesCache> cache_;
};

} // namespace augur::data
