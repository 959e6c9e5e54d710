#include <augur/data/csv_market_data_provider.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace augur::data {

namespace {

constexpr int64_t kDay = 86400;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\"");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\"");
    return text.substr(first, last - first + 1);
}

std::optional<core::Bar> parse_line(const std::string& line) {
    std::stringstream ss(line);
    std::string date, open_str, high_str, low_str, close_str, volume_str;

    std::getline(ss, date, ',');
    std::getline(ss, open_str, ',');
    std::getline(ss, high_str, ',');
    std::getline(ss, low_str, ',');
    std::getline(ss, close_str, ',');
    std::getline(ss, volume_str, ',');

    auto timestamp = CsvMarketDataProvider::parse_timestamp(trim(date));
    if (!timestamp || trim(close_str).empty()) {
        return std::nullopt;
    }

    try {
        core::Bar bar;
        bar.timestamp = *timestamp;
        bar.open = std::stod(trim(open_str));
        bar.high = std::stod(trim(high_str));
        bar.low = std::stod(trim(low_str));
        bar.close = std::stod(trim(close_str));
        const std::string volume = trim(volume_str);
        bar.volume = volume.empty() ? 0.0 : std::stod(volume);
        return bar;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

CsvMarketDataProvider::CsvMarketDataProvider(std::string data_dir)
    : data_dir_(std::move(data_dir)) {}

std::optional<int64_t> CsvMarketDataProvider::period_seconds(const std::string& period) {
    if (period == "max") {
        return std::nullopt;
    }
    if (period == "ytd") {
        return 365 * kDay;
    }

    size_t digits = 0;
    while (digits < period.size() && std::isdigit(static_cast<unsigned char>(period[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits == period.size()) {
        throw std::invalid_argument("unrecognised period: " + period);
    }

    const std::string unit = period.substr(digits);
    int64_t unit_seconds = 0;
    if (unit == "d") {
        unit_seconds = kDay;
    } else if (unit == "wk") {
        unit_seconds = 7 * kDay;
    } else if (unit == "mo") {
        unit_seconds = 30 * kDay;
    } else if (unit == "y") {
        unit_seconds = 365 * kDay;
    } else {
        throw std::invalid_argument("unrecognised period: " + period);
    }

    // Digits only, so stoll can fail on range alone
    int64_t count = 0;
    try {
        count = std::stoll(period.substr(0, digits));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("period out of range: " + period);
    }
    if (count > std::numeric_limits<int64_t>::max() / unit_seconds) {
        throw std::invalid_argument("period out of range: " + period);
    }
    return count * unit_seconds;
}

std::optional<int64_t> CsvMarketDataProvider::parse_timestamp(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return std::stoll(text);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    std::istringstream iss(text);
    if (text.size() > 10) {
        iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (iss.fail()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(timegm(&tm));
}

std::string CsvMarketDataProvider::resolve_path(const std::string& symbol, const std::string& interval) const {
    const std::filesystem::path dir(data_dir_);
    const auto with_interval = dir / (symbol + "_" + interval + ".csv");
    if (std::filesystem::exists(with_interval)) {
        return with_interval.string();
    }
    return (dir / (symbol + ".csv")).string();
}

core::PriceSeries CsvMarketDataProvider::load_file(const std::string& symbol, const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        utils::Logger::error() << "CSV file does not exist: " << path << utils::Logger::endl;
        return core::PriceSeries(symbol, {});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open CSV file: " << path << utils::Logger::endl;
        return core::PriceSeries(symbol, {});
    }

    std::string line;
    // Skip header line
    std::getline(file, line);

    std::vector<core::Bar> bars;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        if (auto bar = parse_line(line)) {
            bars.push_back(*bar);
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        utils::Logger::warn() << "Skipped " << skipped << " unparseable rows in " << path << utils::Logger::endl;
    }

    // Stable sort keeps file order among equal timestamps, so the last row wins below
    std::stable_sort(bars.begin(), bars.end(),
                     [](const core::Bar& a, const core::Bar& b) { return a.timestamp < b.timestamp; });

    std::vector<core::Bar> unique_bars;
    unique_bars.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique_bars.empty() && unique_bars.back().timestamp == bar.timestamp) {
            unique_bars.back() = bar;
        } else {
            unique_bars.push_back(bar);
        }
    }

    utils::Logger::debug() << "Loaded " << unique_bars.size() << " bars for " << symbol
                           << " from " << path << utils::Logger::endl;
    return core::PriceSeries(symbol, std::move(unique_bars));
}

core::PriceSeries CsvMarketDataProvider::get_series(const std::string& symbol,
                                                    const std::string& period,
                                                    const std::string& interval) {
    core::PriceSeries full = load_file(symbol, resolve_path(symbol, interval));
    if (full.empty()) {
        return full;
    }

    std::optional<int64_t> span;
    try {
        span = period_seconds(period);
    } catch (const std::logic_error& e) {
        utils::Logger::warn() << e.what() << ", returning full history for " << symbol << utils::Logger::endl;
    }
    if (!span) {
        return full;
    }

    const int64_t cutoff = full.back().timestamp - *span;
    std::vector<core::Bar> recent;
    for (const auto& bar : full.bars()) {
        if (bar.timestamp >= cutoff) {
            recent.push_back(bar);
        }
    }
    return core::PriceSeries(symbol, std::move(recent));
}

} // namespace augur::data
