// include/augur/indicators/indicator_engine.hpp
#pragma once
#include <augur/core/price_series.hpp>
#include <augur/indicators/indicator_set.hpp>
#include <augur/utils/config.hpp>
#include <stdexcept>
#include <string>

namespace augur {
namespace indicators {

// Raised for malformed input when the engine runs with FailurePolicy::RAISE
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& what) : std::runtime_error(what) {}
};

enum class FailurePolicy {
    DEGRADE,  // log and hand back the series without indicators
    RAISE     // throw ComputationError
};

struct IndicatorConfiguration {
    // MACD
    size_t macd_fast = 12;
    size_t macd_slow = 26;
    size_t macd_signal = 9;
    
    // Bollinger Bands
    size_t bollinger_period = 20;
    double bollinger_width = 2.0;
    size_t bollinger_ddof = 1;
    
    // RSI
    size_t rsi_period = 14;
    
    FailurePolicy failure_policy = FailurePolicy::DEGRADE;

    // Reads indicators.macd_fast, indicators.macd_slow, indicators.macd_signal,
    // indicators.bollinger_period, indicators.bollinger_width,
    // indicators.rsi_period and indicators.on_failure (degrade|raise).
    static IndicatorConfiguration from_config(const utils::Config& config);
};

class IndicatorEngine {
public:
    IndicatorEngine();
    explicit IndicatorEngine(const IndicatorConfiguration& config);

    void configure(const IndicatorConfiguration& config);
    const IndicatorConfiguration& config() const { return config_; }

    // Appends MACD, Bollinger Bands and RSI to a copy of the series.
    // An empty series yields an empty indicator set.
    EnrichedSeries compute(const core::PriceSeries& series) const;

private:
    IndicatorSet calculate(const core::PriceSeries& series) const;
    EnrichedSeries degrade(const core::PriceSeries& series, const std::string& reason) const;

    IndicatorConfiguration config_;
};

// Default engine, degrading on failure
EnrichedSeries compute_indicators(const core::PriceSeries& series);

} // namespace indicators
} // namespace augur
