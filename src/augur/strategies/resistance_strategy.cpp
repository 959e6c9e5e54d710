#include <augur/strategies/resistance_strategy.hpp>
#include <augur/indicators/series_math.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace augur::strategies {

ResistanceStrategy::ResistanceStrategy() : StrategyBase(NAME) {}

void ResistanceStrategy::initialize() {
    const double window = get_number("window_size", 20.0);
    if (window < 1.0 || window != std::floor(window)) {
        throw std::invalid_argument(name_ + ": window_size must be a positive integer");
    }
    window_size_ = static_cast<size_t>(window);
    touch_tolerance_ = get_number("touch_tolerance", 0.01);
    touch_weight_ = get_number("touch_weight", 0.2);
    breakout_distance_ = get_number("breakout_distance", 0.10);
    open_sky_strength_ = get_number("open_sky_strength", 0.8);
}

std::vector<double> ResistanceStrategy::identify_levels(const core::PriceSeries& series) const {
    std::vector<double> levels;
    if (series.size() < 2 * window_size_) {
        return levels;
    }

    const auto highs = series.highs();
    const auto rolling_max = indicators::centered_rolling_max(highs, window_size_);

    const size_t behind = window_size_ / 2;
    const size_t ahead = (window_size_ - 1) / 2;
    for (size_t i = window_size_; i < highs.size() - window_size_; ++i) {
        if (rolling_max[i] != highs[i]) {
            continue;
        }
        const auto first = highs.begin() + static_cast<std::ptrdiff_t>(i - behind);
        const auto last = highs.begin() + static_cast<std::ptrdiff_t>(i + ahead + 1);
        // A flat window has no peak
        if (std::any_of(first, last, [&](double high) { return high < highs[i]; })) {
            levels.push_back(highs[i]);
        }
    }

    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
    return levels;
}

ResistanceLevel ResistanceStrategy::evaluate_level(double price, double level,
                                                   const core::PriceSeries& series) const {
    size_t tests = 0;
    for (const auto& bar : series.bars()) {
        if (std::abs(bar.high - level) / level < touch_tolerance_) {
            ++tests;
        }
    }

    const double proximity = std::abs(price - level) / level;
    const double strength = static_cast<double>(tests) * touch_weight_ * (1.0 - proximity);
    return {level, std::clamp(strength, 0.0, 1.0)};
}

core::Signal ResistanceStrategy::generate_signals(const indicators::EnrichedSeries& series) const {
    if (series.size() < min_bars()) {
        return core::Signal::neutral();
    }

    const double price = series.last_close();
    const auto levels = identify_levels(series.series());

    // Levels are sorted, so the first one above the close is the nearest
    auto above = std::upper_bound(levels.begin(), levels.end(), price);
    if (above == levels.end()) {
        return core::Signal::buy(open_sky_strength_);
    }

    const ResistanceLevel nearest = evaluate_level(price, *above, series.series());
    const double price_to_resistance = (nearest.price - price) / price;

    if (price_to_resistance > breakout_distance_) {
        return core::Signal::buy(1.0 - nearest.strength);
    }
    return core::Signal::sell(nearest.strength);
}

} // namespace augur::strategies
