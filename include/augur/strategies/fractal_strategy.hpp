#pragma once
#include <augur/strategy/strategy_base.hpp>
#include <augur/core/price_series.hpp>
#include <vector>

namespace augur::strategies {

enum class FractalKind {
    BULLISH,
    BEARISH
};

struct FractalPoint {
    size_t index;
    FractalKind kind;
};

class FractalStrategy : public strategy::StrategyBase {
public:
    static constexpr const char* NAME = "Fractal";
    static constexpr size_t BOX_SCALES = 20;
    static constexpr size_t RECENT_BARS = 3;

    FractalStrategy();

    core::Signal generate_signals(const indicators::EnrichedSeries& series) const override;
    size_t min_bars() const override { return window_size_; }
    void initialize() override;

    // Box-counting dimension of the closes normalised to [0, 1], over 20
    // log-spaced box sizes from 1e-3 to 1. Short or flat series give 1.0.
    double fractal_dimension(const std::vector<double>& closes) const;

    // 5-bar fractals: a low strictly below the two lows on each side is
    // bullish, a high strictly above the two highs on each side is bearish.
    // One bar may carry both. Points are ordered by index, bullish first.
    std::vector<FractalPoint> identify_fractals(const core::PriceSeries& series) const;

private:
    size_t window_size_ = 5;
};

} // namespace augur::strategies
