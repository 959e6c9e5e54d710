#include <augur/analysis/analyzer_setup.hpp>
#include <augur/data/caching_market_data_provider.hpp>
#include <augur/data/csv_market_data_provider.hpp>
#include <augur/strategy/strategy_factory.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace augur::analysis {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::unique_ptr<SymbolAnalyzer> make_analyzer(const utils::Config& config) {
    const std::string data_dir = config.get("data_dir", std::string("data"));
    const auto ttl = std::chrono::seconds(
        config.get<long>("cache.ttl_seconds", data::CachingMarketDataProvider::DEFAULT_TTL.count()));

    auto csv_provider = std::make_shared<data::CsvMarketDataProvider>(data_dir);
    auto cache = std::make_shared<data::SeriesCache>(ttl);
    auto provider = std::make_shared<data::CachingMarketDataProvider>(csv_provider, cache);

    auto analyzer = std::make_unique<SymbolAnalyzer>(
        provider, AnalyzerConfiguration::from_config(config), SignalAggregator::from_config(config));

    strategy::register_default_strategies();
    std::vector<std::string> names = config.get_list("strategies");
    if (names.empty()) {
        names = strategy::StrategyFactory::get_registered_types();
    }

    for (const auto& name : names) {
        auto s = strategy::StrategyFactory::create_strategy(name);
        if (!s) {
            throw std::invalid_argument("unknown strategy: " + name);
        }
        s->configure(config.with_prefix(lowercase(name)));
        analyzer->add_strategy(s);
    }

    utils::Logger::info() << "Analyzer ready with " << names.size() << " strategies, data from "
                          << csv_provider->data_dir() << ", cache ttl " << ttl.count() << "s" << utils::Logger::endl;
    return analyzer;
}

} // namespace augur::analysis
