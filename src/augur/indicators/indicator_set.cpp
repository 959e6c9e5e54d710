#include <augur/indicators/indicator_set.hpp>
#include <stdexcept>

namespace augur::indicators {

bool IndicatorSet::aligned_with(size_t length) const {
    return macd.size() == length &&
           signal_line.size() == length &&
           middle_band.size() == length &&
           std_dev.size() == length &&
           upper_band.size() == length &&
           lower_band.size() == length &&
           rsi.size() == length;
}

EnrichedSeries::EnrichedSeries(core::PriceSeries series)
    : series_(std::move(series)) {}

EnrichedSeries::EnrichedSeries(core::PriceSeries series, IndicatorSet indicators)
    : series_(std::move(series)) {
    if (!indicators.aligned_with(series_.size())) {
        throw std::invalid_argument("indicator columns are not aligned with " +
                                    std::to_string(series_.size()) + " bars of " + series_.symbol());
    }
    indicators_ = std::move(indicators);
}

const IndicatorSet& EnrichedSeries::indicators() const {
    if (!indicators_) {
        throw std::logic_error("no indicators computed for " + series_.symbol());
    }
    return *indicators_;
}

} // namespace augur::indicators
