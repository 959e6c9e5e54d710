#pragma once
#include <augur/analysis/symbol_analyzer.hpp>
#include <augur/utils/config.hpp>
#include <memory>

namespace augur::analysis {

// Wires the analyzer used by the applications from configuration:
//   data_dir             CSV directory for the market data provider
//   cache.ttl_seconds    lifetime of cached series (default 300)
//   strategies           names to instantiate (default: all registered)
//   <name>.<param>       strategy parameters, name lower-cased
//   weight.<Name>, consensus.threshold, period, interval, indicators.*
// Throws std::invalid_argument for an unknown strategy name.
std::unique_ptr<SymbolAnalyzer> make_analyzer(const utils::Config& config);

} // namespace augur::analysis
