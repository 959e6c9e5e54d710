#include <augur/indicators/series_math.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace augur::indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void require_positive(size_t value, const char* what) {
    if (value == 0) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
}

} // namespace

std::vector<double> ema(const std::vector<double>& values, size_t span) {
    require_positive(span, "EMA span");
    std::vector<double> result(values.size(), kNaN);
    if (values.empty()) {
        return result;
    }

    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    result[0] = values[0];
    for (size_t i = 1; i < values.size(); ++i) {
        result[i] = alpha * values[i] + (1.0 - alpha) * result[i - 1];
    }
    return result;
}

std::vector<double> sma(const std::vector<double>& values, size_t window) {
    require_positive(window, "SMA window");
    std::vector<double> result(values.size(), kNaN);

    for (size_t i = window - 1; i < values.size(); ++i) {
        double sum = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            sum += values[j];
        }
        result[i] = sum / static_cast<double>(window);
    }
    return result;
}

std::vector<double> rolling_std(const std::vector<double>& values, size_t window, size_t ddof) {
    require_positive(window, "rolling std window");
    std::vector<double> result(values.size(), kNaN);
    if (window <= ddof) {
        return result;
    }

    for (size_t i = window - 1; i < values.size(); ++i) {
        double sum = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            sum += values[j];
        }
        const double mean = sum / static_cast<double>(window);

        // Two passes keep the variance non-negative for flat windows
        double sum_sq_diff = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            const double diff = values[j] - mean;
            sum_sq_diff += diff * diff;
        }
        result[i] = std::sqrt(sum_sq_diff / static_cast<double>(window - ddof));
    }
    return result;
}

std::vector<double> rsi(const std::vector<double>& values, size_t period) {
    require_positive(period, "RSI period");
    std::vector<double> result(values.size(), kNaN);

    for (size_t i = period; i < values.size(); ++i) {
        double gain_sum = 0.0;
        double loss_sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            const double delta = values[j] - values[j - 1];
            if (delta > 0.0) {
                gain_sum += delta;
            } else if (delta < 0.0) {
                loss_sum -= delta;
            }
        }

        if (std::isnan(gain_sum) || std::isnan(loss_sum)) {
            continue;
        }

        const double avg_gain = gain_sum / static_cast<double>(period);
        const double avg_loss = loss_sum / static_cast<double>(period);
        if (avg_loss == 0.0) {
            result[i] = 100.0;
            continue;
        }

        const double rs = avg_gain / avg_loss;
        result[i] = std::clamp(100.0 - 100.0 / (1.0 + rs), 0.0, 100.0);
    }
    return result;
}

std::vector<double> centered_rolling_max(const std::vector<double>& values, size_t window) {
    require_positive(window, "rolling max window");
    std::vector<double> result(values.size(), kNaN);

    const size_t behind = window / 2;
    const size_t ahead = (window - 1) / 2;
    for (size_t i = behind; i + ahead < values.size(); ++i) {
        double highest = values[i - behind];
        bool missing = false;
        for (size_t j = i - behind; j <= i + ahead; ++j) {
            if (std::isnan(values[j])) {
                missing = true;
                break;
            }
            highest = std::max(highest, values[j]);
        }
        if (!missing) {
            result[i] = highest;
        }
    }
    return result;
}

double linear_fit_slope(const std::vector<double>& xs, const std::vector<double>& ys) {
    const size_t n = std::min(xs.size(), ys.size());
    if (n < 2) {
        return 0.0;
    }

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += xs[i];
        mean_y += ys[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double covariance = 0.0;
    double variance = 0.0;
    for (size_t i = 0; i < n; ++i) {
        covariance += (xs[i] - mean_x) * (ys[i] - mean_y);
        variance += (xs[i] - mean_x) * (xs[i] - mean_x);
    }
    if (variance == 0.0) {
        return 0.0;
    }
    return covariance / variance;
}

} // namespace augur::indicators
