#pragma once
#include <augur/strategy/strategy_base.hpp>
#include <array>
#include <vector>

namespace augur::strategies {

struct FibonacciLevel {
    double ratio;
    double price;
};

/**
 * @class FibonacciStrategy
 * @brief Buys when the close revisits a retracement of the whole-window range
 *
 * The swing high and low are the extremes of the full series. The close is
 * compared against the 23.6%, 38.2% and 61.8% retracements in that order and
 * the first level within `tolerance` (relative to the close) wins. There is
 * no sell rule.
 */
class FibonacciStrategy : public strategy::StrategyBase {
public:
    static constexpr const char* NAME = "Fibonacci";
    static constexpr std::array<double, 7> RATIOS = {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
    static constexpr std::array<double, 3> SUPPORT_RATIOS = {0.236, 0.382, 0.618};

    FibonacciStrategy();

    core::Signal generate_signals(const indicators::EnrichedSeries& series) const override;
    size_t min_bars() const override { return 30; }
    void initialize() override;

    /**
     * @brief Retracement prices high - (high - low) * ratio for every RATIOS entry
     */
    static std::vector<FibonacciLevel> calculate_levels(double high, double low);

private:
    double tolerance_ = 0.02;
};

} // namespace augur::strategies
