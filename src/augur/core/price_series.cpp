#include <augur/core/price_series.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace augur::core {

Bar::Bar(int64_t ts, double o, double h, double l, double c, double v)
    : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}

PriceSeries::PriceSeries(std::string symbol, std::vector<Bar> bars)
    : symbol_(std::move(symbol)), bars_(std::move(bars)) {}

namespace {

template<typename F>
std::vector<double> column(const std::vector<Bar>& bars, F field) {
    std::vector<double> values;
    values.reserve(bars.size());
    for (const auto& bar : bars) {
        values.push_back(field(bar));
    }
    return values;
}

} // namespace

std::vector<double> PriceSeries::opens() const {
    return column(bars_, [](const Bar& b) { return b.open; });
}

std::vector<double> PriceSeries::highs() const {
    return column(bars_, [](const Bar& b) { return b.high; });
}

std::vector<double> PriceSeries::lows() const {
    return column(bars_, [](const Bar& b) { return b.low; });
}

std::vector<double> PriceSeries::closes() const {
    return column(bars_, [](const Bar& b) { return b.close; });
}

std::vector<double> PriceSeries::volumes() const {
    return column(bars_, [](const Bar& b) { return b.volume; });
}

std::vector<int64_t> PriceSeries::timestamps() const {
    std::vector<int64_t> values;
    values.reserve(bars_.size());
    for (const auto& bar : bars_) {
        values.push_back(bar.timestamp);
    }
    return values;
}

std::optional<std::string> PriceSeries::find_defect() const {
    for (size_t i = 0; i < bars_.size(); ++i) {
        const Bar& bar = bars_[i];
        std::ostringstream reason;
        reason << symbol_ << " bar " << i << ": ";

        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) ||
            !std::isfinite(bar.low) || !std::isfinite(bar.close) ||
            !std::isfinite(bar.volume)) {
            reason << "non-finite value";
            return reason.str();
        }
        if (bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0) {
            reason << "non-positive price";
            return reason.str();
        }
        if (bar.high < std::max(bar.open, bar.close)) {
            reason << "high " << bar.high << " below open/close";
            return reason.str();
        }
        if (bar.low > std::min(bar.open, bar.close)) {
            reason << "low " << bar.low << " above open/close";
            return reason.str();
        }
        if (bar.volume < 0.0) {
            reason << "negative volume";
            return reason.str();
        }
        if (i > 0 && bar.timestamp <= bars_[i - 1].timestamp) {
            reason << "timestamp " << bar.timestamp << " not after " << bars_[i - 1].timestamp;
            return reason.str();
        }
    }
    return std::nullopt;
}

} // namespace augur::core
