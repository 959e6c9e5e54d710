#include <augur/analysis/report_format.hpp>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace augur::analysis {

using json = nlohmann::json;

namespace {

json number_or_null(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

std::string cell(const core::Signal& signal) {
    if (signal.is_neutral()) {
        return "HOLD";
    }
    std::ostringstream oss;
    oss << core::to_string(signal.type) << " " << std::fixed << std::setprecision(2) << signal.strength;
    return oss.str();
}

} // namespace

std::string to_json(const AnalysisReport& report) {
    json out;
    out["symbol"] = report.symbol;
    out["bars"] = report.bar_count;
    out["indicators"] = report.indicators_available;
    if (report.error) {
        out["error"] = *report.error;
    }

    const auto& snap = report.snapshot;
    out["snapshot"] = {
        {"close", number_or_null(snap.last_close)},
        {"volume", number_or_null(snap.last_volume)},
        {"change_pct", number_or_null(snap.change_pct)},
        {"macd", number_or_null(snap.macd)},
        {"rsi", number_or_null(snap.rsi)},
        {"band_position", to_string(snap.band_position)}
    };

    json signals = json::object();
    for (const auto& [name, signal] : report.signals) {
        signals[name] = {
            {"buy", signal.is_buy()},
            {"sell", signal.is_sell()},
            {"strength", number_or_null(signal.strength)}
        };
    }
    out["signals"] = std::move(signals);

    const auto& c = report.consensus;
    out["consensus"] = {
        {"action", to_string(c.action)},
        {"score", number_or_null(c.score)},
        {"confidence", number_or_null(c.confidence)},
        {"buy_votes", c.buy_votes},
        {"sell_votes", c.sell_votes},
        {"neutral_votes", c.neutral_votes}
    };
    return out.dump();
}

void print_report_table(std::ostream& out, const std::vector<AnalysisReport>& reports) {
    std::set<std::string> columns;
    for (const auto& report : reports) {
        for (const auto& [name, _] : report.signals) {
            columns.insert(name);
        }
    }

    out << std::left << std::setw(8) << "Symbol" << std::right << std::setw(6) << "Bars"
        << std::setw(10) << "Close" << std::setw(8) << "RSI";
    for (const auto& name : columns) {
        out << std::setw(13) << name;
    }
    out << std::setw(9) << "Action" << std::setw(8) << "Score" << "\n";

    for (const auto& report : reports) {
        out << std::left << std::setw(8) << report.symbol << std::right << std::setw(6) << report.bar_count;
        if (report.error) {
            out << "  error: " << *report.error << "\n";
            continue;
        }

        out << std::fixed << std::setprecision(2)
            << std::setw(10) << report.snapshot.last_close
            << std::setw(8) << report.snapshot.rsi;
        for (const auto& name : columns) {
            auto it = report.signals.find(name);
            out << std::setw(13) << (it != report.signals.end() ? cell(it->second) : "-");
        }
        out << std::setw(9) << to_string(report.consensus.action)
            << std::setw(8) << report.consensus.score << "\n";
    }
    out.unsetf(std::ios::floatfield);
}

} // namespace augur::analysis
