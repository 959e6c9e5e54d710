#include <augur/strategies/bollinger_strategy.hpp>
#include <algorithm>
#include <cmath>

namespace augur::strategies {

BollingerStrategy::BollingerStrategy() : StrategyBase(NAME) {}

void BollingerStrategy::initialize() {
    band_tolerance_ = get_number("band_tolerance", 0.02);
}

core::Signal BollingerStrategy::generate_signals(const indicators::EnrichedSeries& series) const {
    if (series.size() < min_bars() || !series.has_indicators()) {
        return core::Signal::neutral();
    }

    const size_t last = series.size() - 1;
    const double price = series.last_close();
    const double lower = series.indicators().lower_band[last];
    const double upper = series.indicators().upper_band[last];
    if (std::isnan(lower) || std::isnan(upper) || lower == 0.0) {
        return core::Signal::neutral();
    }

    const double lower_dist = (price - lower) / lower;
    const double upper_dist = (upper - price) / price;

    // A close outside the band gives a negative distance; strength tops out at 1
    if (lower_dist < band_tolerance_) {
        return core::Signal::buy(std::clamp(1.0 - lower_dist, 0.0, 1.0));
    }
    if (upper_dist < band_tolerance_) {
        return core::Signal::sell(std::clamp(1.0 - upper_dist, 0.0, 1.0));
    }
    return core::Signal::neutral();
}

} // namespace augur::strategies
