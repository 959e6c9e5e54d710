#include <augur/indicators/indicator_engine.hpp>
#include <augur/indicators/series_math.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cctype>

namespace augur::indicators {

IndicatorConfiguration IndicatorConfiguration::from_config(const utils::Config& config) {
    IndicatorConfiguration result;
    result.macd_fast = config.get_count("indicators.macd_fast", result.macd_fast);
    result.macd_slow = config.get_count("indicators.macd_slow", result.macd_slow);
    result.macd_signal = config.get_count("indicators.macd_signal", result.macd_signal);
    result.bollinger_period = config.get_count("indicators.bollinger_period", result.bollinger_period);
    result.bollinger_width = config.get<double>("indicators.bollinger_width", result.bollinger_width);
    result.rsi_period = config.get_count("indicators.rsi_period", result.rsi_period);

    std::string policy = config.get("indicators.on_failure", std::string("degrade"));
    std::transform(policy.begin(), policy.end(), policy.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (policy == "raise") {
        result.failure_policy = FailurePolicy::RAISE;
    } else if (policy != "degrade") {
        utils::Logger::warn() << "Unknown indicators.on_failure '" << policy
                              << "', using degrade" << utils::Logger::endl;
    }
    return result;
}

IndicatorEngine::IndicatorEngine() = default;

IndicatorEngine::IndicatorEngine(const IndicatorConfiguration& config)
    : config_(config) {}

void IndicatorEngine::configure(const IndicatorConfiguration& config) {
    config_ = config;
}

EnrichedSeries IndicatorEngine::compute(const core::PriceSeries& series) const {
    if (series.empty()) {
        return EnrichedSeries(series, IndicatorSet{});
    }

    try {
        return EnrichedSeries(series, calculate(series));
    } catch (const ComputationError& e) {
        if (config_.failure_policy == FailurePolicy::RAISE) {
            throw;
        }
        return degrade(series, e.what());
    } catch (const std::exception& e) {
        if (config_.failure_policy == FailurePolicy::RAISE) {
            throw ComputationError(e.what());
        }
        return degrade(series, e.what());
    }
}

EnrichedSeries IndicatorEngine::degrade(const core::PriceSeries& series, const std::string& reason) const {
    utils::Logger::warn() << "Indicator computation failed for " << series.symbol()
                          << ", continuing without indicators: " << reason
                          << utils::Logger::endl;
    return EnrichedSeries(series);
}

IndicatorSet IndicatorEngine::calculate(const core::PriceSeries& series) const {
    if (auto defect = series.find_defect()) {
        throw ComputationError("malformed series " + *defect);
    }

    const std::vector<double> closes = series.closes();
    IndicatorSet result;

    // MACD
    const auto fast = ema(closes, config_.macd_fast);
    const auto slow = ema(closes, config_.macd_slow);
    result.macd.resize(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        result.macd[i] = fast[i] - slow[i];
    }
    result.signal_line = ema(result.macd, config_.macd_signal);

    // Bollinger Bands
    result.middle_band = sma(closes, config_.bollinger_period);
    result.std_dev = rolling_std(closes, config_.bollinger_period, config_.bollinger_ddof);
    result.upper_band.resize(closes.size());
    result.lower_band.resize(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        const double offset = config_.bollinger_width * result.std_dev[i];
        result.upper_band[i] = result.middle_band[i] + offset;
        result.lower_band[i] = result.middle_band[i] - offset;
    }

    // RSI
    result.rsi = rsi(closes, config_.rsi_period);

    return result;
}

EnrichedSeries compute_indicators(const core::PriceSeries& series) {
    static const IndicatorEngine engine;
    return engine.compute(series);
}

} // namespace augur::indicators
