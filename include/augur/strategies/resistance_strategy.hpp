#pragma once
#include <augur/strategy/strategy_base.hpp>
#include <augur/core/price_series.hpp>
#include <vector>

namespace augur::strategies {

struct ResistanceLevel {
    double price = 0.0;
    double strength = 0.0; // 0.0 to 1.0
};

/**
 * @class ResistanceStrategy
 * @brief Trades against the nearest historical high above the close
 *
 * With no level above the close the path is open and the strategy buys at
 * open_sky_strength. A level further away than breakout_distance is a buy
 * scaled by how weak that level is; a closer one is a sell scaled by its
 * strength.
 */
class ResistanceStrategy : public strategy::StrategyBase {
public:
    static constexpr const char* NAME = "Resistance";

    ResistanceStrategy();

    core::Signal generate_signals(const indicators::EnrichedSeries& series) const override;
    size_t min_bars() const override { return 2 * window_size_; }
    void initialize() override;

    /**
     * @brief Distinct highs equal to the maximum of their centered window, ascending
     *
     * Only bars at least window_size from either end are considered. Equal
     * highs in one window all count; a window with no lower bar does not.
     */
    std::vector<double> identify_levels(const core::PriceSeries& series) const;

    /**
     * @brief Strength from touches within touch_tolerance and distance to price
     */
    ResistanceLevel evaluate_level(double price, double level, const core::PriceSeries& series) const;

private:
    size_t window_size_ = 20;
    double touch_tolerance_ = 0.01;
    double touch_weight_ = 0.2;
    double breakout_distance_ = 0.10;
    double open_sky_strength_ = 0.8;
};

} // namespace augur::strategies
