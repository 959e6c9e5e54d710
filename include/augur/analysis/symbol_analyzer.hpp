// include/augur/analysis/symbol_analyzer.hpp
#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "augur/analysis/market_snapshot.hpp"
#include "augur/analysis/signal_aggregator.hpp"
#include "augur/data/market_data_provider.hpp"
#include "augur/indicators/indicator_engine.hpp"
#include "augur/strategy/strategy_base.hpp"
#include "augur/utils/config.hpp"

namespace augur {
namespace analysis {

// Analyzer configuration structure
struct AnalyzerConfiguration {
    // Request sent to the market data provider
    std::string period = "1mo";
    std::string interval = "1d";
    
    indicators::IndicatorConfiguration indicators;
    
    // Screen symbols concurrently
    bool parallel_screening = true;

    // period, interval, screen.parallel and indicators.* keys
    static AnalyzerConfiguration from_config(const utils::Config& config);
};

struct AnalysisReport {
    std::string symbol;
    size_t bar_count = 0;
    bool indicators_available = false;
    MarketSnapshot snapshot;
    SignalMap signals;
    Consensus consensus;
    // Set when the symbol could not be analysed at all
    std::optional<std::string> error;
};

class SymbolAnalyzer {
private:
    // Strategies
    std::vector<strategy::StrategyPtr> strategies_;
    mutable std::mutex strategies_mutex_;

    data::MarketDataProviderPtr provider_;
    indicators::IndicatorEngine indicator_engine_;
    SignalAggregator aggregator_;

    // Configuration
    AnalyzerConfiguration config_;

    std::vector<strategy::StrategyPtr> strategies_snapshot() const;
    AnalysisReport analyze_or_report(const std::string& symbol) const;

public:
    explicit SymbolAnalyzer(data::MarketDataProviderPtr provider);
    SymbolAnalyzer(data::MarketDataProviderPtr provider,
                   const AnalyzerConfiguration& config,
                   SignalAggregator aggregator);
    
    // Configuration
    void configure(const AnalyzerConfiguration& config);
    const AnalyzerConfiguration& config() const { return config_; }
    void set_aggregator(SignalAggregator aggregator) { aggregator_ = std::move(aggregator); }
    const SignalAggregator& aggregator() const { return aggregator_; }
    
    // Strategy management; a strategy replaces any other with the same name
    void add_strategy(strategy::StrategyPtr strategy);
    void remove_strategy(const std::string& name);
    strategy::StrategyPtr get_strategy(const std::string& name) const;
    std::vector<std::string> strategy_names() const;

    // Runs every enabled strategy on the snapshot
    SignalMap evaluate(const indicators::EnrichedSeries& series) const;

    // Indicators, signals, consensus and snapshot for one series
    AnalysisReport analyze(const core::PriceSeries& series) const;

    // Fetches through the provider, then analyze()
    AnalysisReport analyze_symbol(const std::string& symbol) const;

    // One report per symbol in input order. A symbol whose analysis throws
    // gets a report with `error` set instead of aborting the screen.
    std::vector<AnalysisReport> screen(const std::vector<std::string>& symbols) const;
};

} // namespace analysis
} // namespace augur
