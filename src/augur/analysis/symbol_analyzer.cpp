#include <augur/analysis/symbol_analyzer.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <execution>
#include <stdexcept>

namespace augur::analysis {

AnalyzerConfiguration AnalyzerConfiguration::from_config(const utils::Config& config) {
    AnalyzerConfiguration result;
    result.period = config.get("period", result.period);
    result.interval = config.get("interval", result.interval);
    result.parallel_screening = config.get_bool("screen.parallel", result.parallel_screening);
    result.indicators = indicators::IndicatorConfiguration::from_config(config);
    return result;
}

SymbolAnalyzer::SymbolAnalyzer(data::MarketDataProviderPtr provider)
    : SymbolAnalyzer(std::move(provider), AnalyzerConfiguration{}, SignalAggregator{}) {}

SymbolAnalyzer::SymbolAnalyzer(data::MarketDataProviderPtr provider,
                               const AnalyzerConfiguration& config,
                               SignalAggregator aggregator)
    : provider_(std::move(provider)),
      indicator_engine_(config.indicators),
      aggregator_(std::move(aggregator)),
      config_(config) {}

void SymbolAnalyzer::configure(const AnalyzerConfiguration& config) {
    config_ = config;
    indicator_engine_.configure(config_.indicators);
}

void SymbolAnalyzer::add_strategy(strategy::StrategyPtr strategy) {
    if (!strategy) {
        throw std::invalid_argument("cannot add a null strategy");
    }

    std::lock_guard<std::mutex> lock(strategies_mutex_);
    auto it = std::find_if(strategies_.begin(), strategies_.end(),
        [&strategy](const strategy::StrategyPtr& s) {
            return s->name() == strategy->name();
        });
    
    if (it != strategies_.end()) {
        utils::Logger::warn() << "Strategy '" << strategy->name() 
                              << "' already added, replacing" << utils::Logger::endl;
        *it = strategy;
    } else {
        strategies_.push_back(strategy);
        utils::Logger::debug() << "Added strategy: " << strategy->name() << utils::Logger::endl;
    }
}

void SymbolAnalyzer::remove_strategy(const std::string& name) {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    auto it = std::find_if(strategies_.begin(), strategies_.end(),
        [&name](const strategy::StrategyPtr& s) {
            return s->name() == name;
        });
    
    if (it != strategies_.end()) {
        strategies_.erase(it);
    } else {
        utils::Logger::warn() << "Strategy '" << name << "' not found for removal" << utils::Logger::endl;
    }
}

strategy::StrategyPtr SymbolAnalyzer::get_strategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    auto it = std::find_if(strategies_.begin(), strategies_.end(),
        [&name](const strategy::StrategyPtr& s) {
            return s->name() == name;
        });
    return it != strategies_.end() ? *it : nullptr;
}

std::vector<std::string> SymbolAnalyzer::strategy_names() const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    std::vector<std::string> names;
    for (const auto& s : strategies_) {
        names.push_back(s->name());
    }
    return names;
}

std::vector<strategy::StrategyPtr> SymbolAnalyzer::strategies_snapshot() const {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    return strategies_;
}

SignalMap SymbolAnalyzer::evaluate(const indicators::EnrichedSeries& series) const {
    SignalMap signals;
    for (const auto& s : strategies_snapshot()) {
        if (s->is_enabled()) {
            signals[s->name()] = s->generate_signals(series);
        }
    }
    return signals;
}

AnalysisReport SymbolAnalyzer::analyze(const core::PriceSeries& series) const {
    const indicators::EnrichedSeries enriched = indicator_engine_.compute(series);

    AnalysisReport report;
    report.symbol = series.symbol();
    report.bar_count = series.size();
    report.indicators_available = enriched.has_indicators() && !enriched.empty();
    report.snapshot = MarketSnapshot::from_series(enriched);
    report.signals = evaluate(enriched);
    report.consensus = aggregator_.aggregate(report.signals);

    utils::Logger::debug() << report.symbol << ": " << to_string(report.consensus.action)
                           << " score=" << report.consensus.score
                           << " (" << report.consensus.buy_votes << " buy, "
                           << report.consensus.sell_votes << " sell, "
                           << report.consensus.neutral_votes << " neutral)" << utils::Logger::endl;
    return report;
}

AnalysisReport SymbolAnalyzer::analyze_symbol(const std::string& symbol) const {
    if (!provider_) {
        throw std::logic_error("no market data provider configured");
    }
    core::PriceSeries series = provider_->get_series(symbol, config_.period, config_.interval);
    if (series.empty()) {
        utils::Logger::warn() << "No price history for " << symbol << utils::Logger::endl;
    }
    AnalysisReport report = analyze(series);
    report.symbol = symbol;
    return report;
}

AnalysisReport SymbolAnalyzer::analyze_or_report(const std::string& symbol) const {
    try {
        return analyze_symbol(symbol);
    } catch (const std::exception& e) {
        utils::Logger::error() << "Analysis failed for " << symbol << ": " << e.what() << utils::Logger::endl;
        AnalysisReport report;
        report.symbol = symbol;
        report.error = e.what();
        return report;
    }
}

std::vector<AnalysisReport> SymbolAnalyzer::screen(const std::vector<std::string>& symbols) const {
    std::vector<AnalysisReport> reports(symbols.size());
    auto analyze_one = [this](const std::string& symbol) { return analyze_or_report(symbol); };

    if (config_.parallel_screening) {
        std::transform(std::execution::par, symbols.begin(), symbols.end(), reports.begin(), analyze_one);
    } else {
        std::transform(symbols.begin(), symbols.end(), reports.begin(), analyze_one);
    }

    utils::Logger::info() << "Screened " << symbols.size() << " symbols" << utils::Logger::endl;
    return reports;
}

} // namespace augur::analysis
