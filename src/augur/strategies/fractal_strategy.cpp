#include <augur/strategies/fractal_strategy.hpp>
#include <augur/indicators/series_math.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace augur::strategies {

namespace {

constexpr size_t kSideBars = 2;

} // namespace

FractalStrategy::FractalStrategy() : StrategyBase(NAME) {}

void FractalStrategy::initialize() {
    const double window = get_number("window_size", 5.0);
    if (window < 1.0 || window != std::floor(window)) {
        throw std::invalid_argument(name_ + ": window_size must be a positive integer");
    }
    window_size_ = static_cast<size_t>(window);
}

double FractalStrategy::fractal_dimension(const std::vector<double>& closes) const {
    if (closes.size() < window_size_ || closes.empty()) {
        return 1.0;
    }

    const auto [min_it, max_it] = std::minmax_element(closes.begin(), closes.end());
    const double range = *max_it - *min_it;
    if (!(range > 0.0)) {
        return 1.0;
    }

    std::vector<double> normalized;
    normalized.reserve(closes.size());
    for (double close : closes) {
        normalized.push_back((close - *min_it) / range);
    }

    std::vector<double> log_scales;
    std::vector<double> log_counts;
    for (size_t k = 0; k < BOX_SCALES; ++k) {
        const double exponent = -3.0 + 3.0 * static_cast<double>(k) / static_cast<double>(BOX_SCALES - 1);
        const double scale = std::pow(10.0, exponent);

        std::set<long long> boxes;
        for (double value : normalized) {
            boxes.insert(static_cast<long long>(std::ceil(value / scale)));
        }

        log_scales.push_back(std::log(scale));
        log_counts.push_back(std::log(static_cast<double>(boxes.size())));
    }

    return -indicators::linear_fit_slope(log_scales, log_counts);
}

std::vector<FractalPoint> FractalStrategy::identify_fractals(const core::PriceSeries& series) const {
    std::vector<FractalPoint> points;
    if (series.size() < window_size_ || series.size() < 2 * kSideBars + 1) {
        return points;
    }

    for (size_t i = kSideBars; i + kSideBars < series.size(); ++i) {
        const double low = series[i].low;
        const double high = series[i].high;

        const double lows_before = std::min(series[i - 2].low, series[i - 1].low);
        const double lows_after = std::min(series[i + 1].low, series[i + 2].low);
        if (lows_before > low && lows_after > low) {
            points.push_back({i, FractalKind::BULLISH});
        }

        const double highs_before = std::max(series[i - 2].high, series[i - 1].high);
        const double highs_after = std::max(series[i + 1].high, series[i + 2].high);
        if (highs_before < high && highs_after < high) {
            points.push_back({i, FractalKind::BEARISH});
        }
    }
    return points;
}

core::Signal FractalStrategy::generate_signals(const indicators::EnrichedSeries& series) const {
    if (series.size() < min_bars()) {
        return core::Signal::neutral();
    }

    const auto fractals = identify_fractals(series.series());
    const size_t recent_start = series.size() > RECENT_BARS ? series.size() - RECENT_BARS : 0;

    auto recent = [&](FractalKind kind) {
        return std::any_of(fractals.begin(), fractals.end(), [&](const FractalPoint& p) {
            return p.index >= recent_start && p.kind == kind;
        });
    };

    const bool bullish = recent(FractalKind::BULLISH);
    const bool bearish = !bullish && recent(FractalKind::BEARISH);
    if (!bullish && !bearish) {
        return core::Signal::neutral();
    }

    const double dimension = fractal_dimension(series.series().closes());
    const double strength = std::clamp(dimension / 2.0, 0.0, 1.0);
    return bullish ? core::Signal::buy(strength) : core::Signal::sell(strength);
}

} // namespace augur::strategies
