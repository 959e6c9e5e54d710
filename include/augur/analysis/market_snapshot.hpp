#pragma once
#include <augur/indicators/indicator_set.hpp>
#include <string>

namespace augur::analysis {

enum class BandPosition {
    ABOVE_UPPER,
    BELOW_LOWER,
    WITHIN,
    UNKNOWN
};

std::string to_string(BandPosition position);

// Latest-bar context shown next to the strategy signals. Fields that need
// more history or missing indicators are NaN, or UNKNOWN for the band.
struct MarketSnapshot {
    double last_close;
    double last_volume;
    double change_pct;   // percent change of the last close over the previous one
    double macd;
    double rsi;
    BandPosition band_position = BandPosition::UNKNOWN;

    MarketSnapshot();

    static MarketSnapshot from_series(const indicators::EnrichedSeries& series);
};

} // namespace augur::analysis
