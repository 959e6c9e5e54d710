#include <augur/data/caching_market_data_provider.hpp>
#include <augur/utils/logger.hpp>
#include <stdexcept>

namespace augur::data {

CachingMarketDataProvider::CachingMarketDataProvider(MarketDataProviderPtr upstream,
                                                     std::shared_ptr<SeriesCache> cache)
    : upstream_(std::move(upstream)), cache_(std::move(cache)) {
    if (!upstream_ || !cache_) {
        throw std::invalid_argument("CachingMarketDataProvider needs an upstream provider and a cache");
    }
}

std::string CachingMarketDataProvider::cache_key(const std::string& symbol,
                                                 const std::string& period,
                                                 const std::string& interval) {
    return symbol + "_" + period + "_" + interval;
}

core::PriceSeries CachingMarketDataProvider::get_series(const std::string& symbol,
                                                        const std::string& period,
                                                        const std::string& interval) {
    const std::string key = cache_key(symbol, period, interval);
    if (auto cached = cache_->get(key)) {
        utils::Logger::debug() << "Cache hit for " << key << utils::Logger::endl;
        return *cached;
    }

    core::PriceSeries series = upstream_->get_series(symbol, period, interval);
    if (!series.empty()) {
        cache_->put(key, series);
    }
    return series;
}

} // namespace augur::data
