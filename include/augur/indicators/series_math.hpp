#pragma once
#include <vector>
#include <cstddef>

namespace augur::indicators {

// Rolling and recursive statistics over a column. Positions without enough
// history hold quiet NaN so every output stays aligned with its input.

// Recursive EMA seeded with the first value, alpha = 2 / (span + 1).
std::vector<double> ema(const std::vector<double>& values, size_t span);

// Simple moving average; the first window-1 entries are NaN.
std::vector<double> sma(const std::vector<double>& values, size_t window);

// Rolling standard deviation with the given delta degrees of freedom
// (1 = sample std, 0 = population std).
std::vector<double> rolling_std(const std::vector<double>& values, size_t window, size_t ddof = 1);

// Relative Strength Index from rolling mean gains and losses over `period`
// price changes. Defined from index `period`; a window without losses is 100.
std::vector<double> rsi(const std::vector<double>& values, size_t period);

// Maximum over [i - window/2, i + (window-1)/2]; NaN where that range
// leaves the series.
std::vector<double> centered_rolling_max(const std::vector<double>& values, size_t window);

// Least-squares slope of ys against xs. Returns 0 for fewer than two points
// or a degenerate x range.
double linear_fit_slope(const std::vector<double>& xs, const std::vector<double>& ys);

} // namespace augur::indicators
