#pragma once
#include <augur/core/price_series.hpp>
#include <vector>
#include <optional>
#include <cstddef>

namespace augur::indicators {

// Derived columns aligned 1:1 with a PriceSeries. Warm-up positions hold NaN.
struct IndicatorSet {
    std::vector<double> macd;
    std::vector<double> signal_line;
    std::vector<double> middle_band;   // 20-period SMA of close
    std::vector<double> std_dev;
    std::vector<double> upper_band;
    std::vector<double> lower_band;
    std::vector<double> rsi;

    size_t size() const { return macd.size(); }
    bool aligned_with(size_t length) const;
};

// A price series together with its indicators. The indicator set is absent
// when computation was skipped or degraded.
class EnrichedSeries {
public:
    EnrichedSeries() = default;
    explicit EnrichedSeries(core::PriceSeries series);
    // Throws std::invalid_argument when a column length differs from the series
    EnrichedSeries(core::PriceSeries series, IndicatorSet indicators);

    const core::PriceSeries& series() const { return series_; }
    const std::string& symbol() const { return series_.symbol(); }
    size_t size() const { return series_.size(); }
    bool empty() const { return series_.empty(); }

    bool has_indicators() const { return indicators_.has_value(); }
    // Throws std::logic_error when has_indicators() is false
    const IndicatorSet& indicators() const;

    double last_close() const { return series_.back().close; }

private:
    core::PriceSeries series_;
    std::optional<IndicatorSet> indicators_;
};

} // namespace augur::indicators
