#pragma once
#include <augur/strategy/strategy_base.hpp>

namespace augur::strategies {

// Signal-line crossover between the last two bars. Buys when MACD moves from
// at-or-below the signal line to above it, sells on the opposite move.
// Strength is |MACD - signal| on the last bar; strength_mode=clamp caps it
// at 1, the default strength_mode=raw leaves it unbounded.
class MACDStrategy : public strategy::StrategyBase {
public:
    static constexpr const char* NAME = "MACD";

    MACDStrategy();

    core::Signal generate_signals(const indicators::EnrichedSeries& series) const override;
    size_t min_bars() const override { return 2; }
    void initialize() override;

    bool clamps_strength() const { return clamp_strength_; }

private:
    bool clamp_strength_ = false;
};

} // namespace augur::strategies
