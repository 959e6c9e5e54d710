#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace augur::core {

struct Bar {
    int64_t timestamp = 0; // seconds since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    Bar() = default;
    Bar(int64_t ts, double o, double h, double l, double c, double v);
};

// Ordered OHLCV history for one symbol. Never modified after construction;
// indicator computation builds a separate enriched view.
class PriceSeries {
public:
    PriceSeries() = default;
    PriceSeries(std::string symbol, std::vector<Bar> bars);

    const std::string& symbol() const { return symbol_; }
    const std::vector<Bar>& bars() const { return bars_; }
    const Bar& operator[](size_t index) const { return bars_[index]; }
    const Bar& back() const { return bars_.back(); }
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    std::vector<double> opens() const;
    std::vector<double> highs() const;
    std::vector<double> lows() const;
    std::vector<double> closes() const;
    std::vector<double> volumes() const;
    std::vector<int64_t> timestamps() const;

    // Describes the first bar that breaks the OHLCV invariants
    // (positive prices, high/low envelope, non-negative volume,
    // strictly increasing timestamps), or nullopt for a well-formed series.
    std::optional<std::string> find_defect() const;

private:
    std::string symbol_;
    std::vector<Bar> bars_;
};

} // namespace augur::core
