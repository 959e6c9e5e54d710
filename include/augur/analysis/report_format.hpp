#pragma once
#include <augur/analysis/symbol_analyzer.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace augur::analysis {

// Single-line JSON object for one report; NaN values are written as null
std::string to_json(const AnalysisReport& report);

// Fixed-width console table, one row per symbol and one column per strategy
void print_report_table(std::ostream& out, const std::vector<AnalysisReport>& reports);

} // namespace augur::analysis
