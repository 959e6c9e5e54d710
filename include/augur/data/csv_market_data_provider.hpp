#pragma once
#include <augur/data/market_data_provider.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace augur::data {

// Loads daily or intraday bars from CSV files under a directory.
//
// File lookup: <dir>/<SYMBOL>_<interval>.csv, then <dir>/<SYMBOL>.csv.
// Layout: a header row, then Date,Open,High,Low,Close,Volume where Date is
// epoch seconds or "YYYY-MM-DD[ HH:MM:SS]" in UTC. Rows that do not parse
// are skipped, bars are sorted and a repeated timestamp keeps its last row.
class CsvMarketDataProvider : public MarketDataProvider {
public:
    explicit CsvMarketDataProvider(std::string data_dir);

    core::PriceSeries get_series(const std::string& symbol,
                                 const std::string& period,
                                 const std::string& interval) override;

    // Loads a whole file without period filtering
    core::PriceSeries load_file(const std::string& symbol, const std::string& path) const;

    // Span of a period string in seconds, nullopt for "max".
    // Throws std::invalid_argument for unrecognised text.
    static std::optional<int64_t> period_seconds(const std::string& period);

    // Parses epoch seconds or YYYY-MM-DD[ HH:MM:SS]
    static std::optional<int64_t> parse_timestamp(const std::string& text);

    const std::string& data_dir() const { return data_dir_; }

private:
    std::string resolve_path(const std::string& symbol, const std::string& interval) const;

    std::string data_dir_;
};

} // namespace augur::data
