#pragma once
#include <augur/strategy/strategy_base.hpp>

namespace augur::strategies {

// Band proximity: buy when the close sits within band_tolerance above the
// lower band, otherwise sell when it sits within band_tolerance below the
// upper band.
class BollingerStrategy : public strategy::StrategyBase {
public:
    static constexpr const char* NAME = "Bollinger";

    BollingerStrategy();

    core::Signal generate_signals(const indicators::EnrichedSeries& series) const override;
    size_t min_bars() const override { return 20; }
    void initialize() override;

private:
    double band_tolerance_ = 0.02;
};

} // namespace augur::strategies
