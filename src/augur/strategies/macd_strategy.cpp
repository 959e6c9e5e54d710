#include <augur/strategies/macd_strategy.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace augur::strategies {

MACDStrategy::MACDStrategy() : StrategyBase(NAME) {}

void MACDStrategy::initialize() {
    const std::string mode = get_config("strength_mode", "raw");
    if (mode == "raw") {
        clamp_strength_ = false;
    } else if (mode == "clamp") {
        clamp_strength_ = true;
    } else {
        throw std::invalid_argument(name_ + ": strength_mode must be raw or clamp, got " + mode);
    }
}

core::Signal MACDStrategy::generate_signals(const indicators::EnrichedSeries& series) const {
    if (series.size() < min_bars() || !series.has_indicators()) {
        return core::Signal::neutral();
    }

    const auto& macd = series.indicators().macd;
    const auto& signal_line = series.indicators().signal_line;
    const size_t last = series.size() - 1;

    const double macd_prev = macd[last - 1];
    const double signal_prev = signal_line[last - 1];
    const double macd_now = macd[last];
    const double signal_now = signal_line[last];

    double strength = std::abs(macd_now - signal_now);
    if (clamp_strength_) {
        strength = std::min(strength, 1.0);
    }

    // NaN compares false everywhere, so undefined columns stay neutral
    if (macd_prev <= signal_prev && macd_now > signal_now) {
        return core::Signal::buy(strength);
    }
    if (macd_prev >= signal_prev && macd_now < signal_now) {
        return core::Signal::sell(strength);
    }
    return core::Signal::neutral();
}

} // namespace augur::strategies
