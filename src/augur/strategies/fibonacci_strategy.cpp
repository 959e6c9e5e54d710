#include <augur/strategies/fibonacci_strategy.hpp>
#include <algorithm>
#include <cmath>

namespace augur::strategies {

FibonacciStrategy::FibonacciStrategy() : StrategyBase(NAME) {}

void FibonacciStrategy::initialize() {
    tolerance_ = get_number("tolerance", 0.02);
}

std::vector<FibonacciLevel> FibonacciStrategy::calculate_levels(double high, double low) {
    const double diff = high - low;
    std::vector<FibonacciLevel> levels;
    levels.reserve(RATIOS.size());
    for (double ratio : RATIOS) {
        levels.push_back({ratio, high - diff * ratio});
    }
    return levels;
}

core::Signal FibonacciStrategy::generate_signals(const indicators::EnrichedSeries& series) const {
    if (series.size() < min_bars()) {
        return core::Signal::neutral();
    }

    const auto& bars = series.series().bars();
    double high = bars.front().high;
    double low = bars.front().low;
    for (const auto& bar : bars) {
        high = std::max(high, bar.high);
        low = std::min(low, bar.low);
    }

    const double price = series.last_close();
    const auto levels = calculate_levels(high, low);

    for (double ratio : SUPPORT_RATIOS) {
        auto level = std::find_if(levels.begin(), levels.end(),
            [ratio](const FibonacciLevel& l) { return l.ratio == ratio; });

        const double distance = std::abs(price - level->price) / price;
        if (distance < tolerance_) {
            return core::Signal::buy(1.0 - distance);
        }
    }
    return core::Signal::neutral();
}

} // namespace augur::strategies
