#include <augur/analysis/market_snapshot.hpp>
#include <cmath>
#include <limits>

namespace augur::analysis {

std::string to_string(BandPosition position) {
    switch (position) {
        case BandPosition::ABOVE_UPPER:
            return "Above upper band";
        case BandPosition::BELOW_LOWER:
            return "Below lower band";
        case BandPosition::WITHIN:
            return "Within bands";
        case BandPosition::UNKNOWN:
            break;
    }
    return "Unknown";
}

MarketSnapshot::MarketSnapshot()
    : last_close(std::numeric_limits<double>::quiet_NaN()),
      last_volume(std::numeric_limits<double>::quiet_NaN()),
      change_pct(std::numeric_limits<double>::quiet_NaN()),
      macd(std::numeric_limits<double>::quiet_NaN()),
      rsi(std::numeric_limits<double>::quiet_NaN()) {}

MarketSnapshot MarketSnapshot::from_series(const indicators::EnrichedSeries& series) {
    MarketSnapshot snapshot;
    if (series.empty()) {
        return snapshot;
    }

    const auto& bars = series.series().bars();
    const size_t last = bars.size() - 1;
    snapshot.last_close = bars[last].close;
    snapshot.last_volume = bars[last].volume;
    if (last > 0) {
        const double previous = bars[last - 1].close;
        snapshot.change_pct = (snapshot.last_close - previous) / previous * 100.0;
    }

    if (!series.has_indicators()) {
        return snapshot;
    }

    const auto& ind = series.indicators();
    snapshot.macd = ind.macd[last];
    snapshot.rsi = ind.rsi[last];

    const double upper = ind.upper_band[last];
    const double lower = ind.lower_band[last];
    if (std::isnan(upper) || std::isnan(lower)) {
        return snapshot;
    }
    if (snapshot.last_close > upper) {
        snapshot.band_position = BandPosition::ABOVE_UPPER;
    } else if (snapshot.last_close < lower) {
        snapshot.band_position = BandPosition::BELOW_LOWER;
    } else {
        snapshot.band_position = BandPosition::WITHIN;
    }
    return snapshot;
}

} // namespace augur::analysis
