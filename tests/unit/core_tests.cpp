#include <gtest/gtest.h>
#include <augur/core/signal.hpp>
#include <augur/core/price_series.hpp>
#include <augur/analysis/signal_aggregator.hpp>
#include <augur/analysis/market_snapshot.hpp>
#include <augur/analysis/symbol_analyzer.hpp>
#include <augur/analysis/report_format.hpp>
#include <augur/data/market_data_provider.hpp>
#include <augur/strategy/strategy_base.hpp>
#include <augur/strategy/strategy_factory.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using augur::core::Bar;
using augur::core::PriceSeries;
using augur::core::Signal;
using augur::core::SignalType;

namespace {

PriceSeries make_series(const std::string& symbol, const std::vector<double>& closes) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back(static_cast<int64_t>(i) * 86400, c, c + 1.0, c - 1.0, c, 500.0 + i);
    }
    return PriceSeries(symbol, std::move(bars));
}

std::vector<double> wave(size_t length) {
    std::vector<double> closes;
    for (size_t i = 0; i < length; ++i) {
        closes.push_back(100.0 + 10.0 * std::sin(static_cast<double>(i) / 5.0) + 0.1 * i);
    }
    return closes;
}

// Serves fixed series from memory and throws for symbols named "THROW"
class StaticProvider : public augur::data::MarketDataProvider {
public:
    std::map<std::string, PriceSeries> series;
    std::atomic<int> requests{0};

    PriceSeries get_series(const std::string& symbol,
                           const std::string& /*period*/,
                           const std::string& /*interval*/) override {
        ++requests;
        if (symbol == "THROW") {
            throw std::runtime_error("feed unavailable");
        }
        auto it = series.find(symbol);
        return it != series.end() ? it->second : PriceSeries(symbol, {});
    }
};

// Fixed-signal strategy for analyzer wiring tests
class FixedStrategy : public augur::strategy::StrategyBase {
public:
    FixedStrategy(const std::string& name, Signal signal)
        : StrategyBase(name), signal_(signal) {}

    Signal generate_signals(const augur::indicators::EnrichedSeries& /*series*/) const override {
        return signal_;
    }
    size_t min_bars() const override { return 1; }

private:
    Signal signal_;
};

} // namespace

// Test Signal
TEST(SignalTest, Construction) {
    Signal hold;
    EXPECT_TRUE(hold.is_neutral());
    EXPECT_FALSE(hold.is_buy());
    EXPECT_FALSE(hold.is_sell());
    EXPECT_DOUBLE_EQ(hold.strength, 0.0);
    EXPECT_EQ(hold, Signal::neutral());

    Signal buy = Signal::buy(0.7);
    EXPECT_TRUE(buy.is_buy());
    EXPECT_DOUBLE_EQ(buy.strength, 0.7);
    EXPECT_NE(buy, Signal::sell(0.7));

    // Neutral never carries strength
    Signal forced(SignalType::NEUTRAL, 0.9);
    EXPECT_DOUBLE_EQ(forced.strength, 0.0);
    EXPECT_EQ(forced, Signal::neutral());
}

TEST(SignalTest, Names) {
    EXPECT_EQ(augur::core::to_string(SignalType::BUY), "BUY");
    EXPECT_EQ(augur::core::to_string(SignalType::SELL), "SELL");
    EXPECT_EQ(augur::core::to_string(SignalType::NEUTRAL), "HOLD");
}

// Test PriceSeries
TEST(PriceSeriesTest, Columns) {
    PriceSeries series = make_series("AAPL", {10.0, 11.0, 12.0});

    EXPECT_EQ(series.symbol(), "AAPL");
    EXPECT_EQ(series.size(), 3);
    EXPECT_EQ(series.closes(), (std::vector<double>{10.0, 11.0, 12.0}));
    EXPECT_EQ(series.highs(), (std::vector<double>{11.0, 12.0, 13.0}));
    EXPECT_EQ(series.timestamps().back(), 2 * 86400);
    EXPECT_DOUBLE_EQ(series.back().close, 12.0);
    EXPECT_FALSE(series.find_defect().has_value());
}

TEST(PriceSeriesTest, Defects) {
    auto defect_of = [](const Bar& bar) {
        return PriceSeries("X", {Bar(0, 10, 11, 9, 10, 1), bar}).find_defect();
    };

    EXPECT_TRUE(defect_of(Bar(86400, 10, 11, 9, 0, 1)).has_value());       // zero close
    EXPECT_TRUE(defect_of(Bar(86400, 10, 9.5, 9, 10, 1)).has_value());     // high below open
    EXPECT_TRUE(defect_of(Bar(86400, 10, 11, 10.5, 10, 1)).has_value());   // low above close
    EXPECT_TRUE(defect_of(Bar(86400, 10, 11, 9, 10, -1)).has_value());     // negative volume
    EXPECT_TRUE(defect_of(Bar(0, 10, 11, 9, 10, 1)).has_value());          // repeated timestamp
    EXPECT_TRUE(defect_of(Bar(86400, 10, std::numeric_limits<double>::infinity(), 9, 10, 1)).has_value());
    EXPECT_FALSE(defect_of(Bar(86400, 10, 10, 10, 10, 0)).has_value());
}

// Test SignalAggregator
TEST(SignalAggregatorTest, EmptyIsHold) {
    augur::analysis::SignalAggregator aggregator;
    auto consensus = aggregator.aggregate({});
    EXPECT_EQ(consensus.action, augur::analysis::Action::HOLD);
    EXPECT_DOUBLE_EQ(consensus.score, 0.0);
}

TEST(SignalAggregatorTest, MajorityBuy) {
    augur::analysis::SignalAggregator aggregator;
    auto consensus = aggregator.aggregate({
        {"A", Signal::buy(0.9)},
        {"B", Signal::buy(0.6)},
        {"C", Signal::neutral()},
    });

    EXPECT_EQ(consensus.action, augur::analysis::Action::BUY);
    EXPECT_NEAR(consensus.score, 0.5, 1e-12);
    EXPECT_NEAR(consensus.confidence, 0.5, 1e-12);
    EXPECT_EQ(consensus.buy_votes, 2);
    EXPECT_EQ(consensus.sell_votes, 0);
    EXPECT_EQ(consensus.neutral_votes, 1);
}

TEST(SignalAggregatorTest, SellAndUnboundedStrength) {
    augur::analysis::SignalAggregator aggregator;

    auto sell = aggregator.aggregate({{"A", Signal::sell(1.0)}, {"B", Signal::neutral()}});
    EXPECT_EQ(sell.action, augur::analysis::Action::SELL);
    EXPECT_NEAR(sell.score, -0.5, 1e-12);

    // A raw MACD magnitude counts as full strength
    auto mixed = aggregator.aggregate({{"MACD", Signal::buy(3.7)}, {"B", Signal::sell(0.5)}});
    EXPECT_NEAR(mixed.score, 0.25, 1e-12);
    EXPECT_EQ(mixed.action, augur::analysis::Action::BUY);
}

TEST(SignalAggregatorTest, WeightsAndThreshold) {
    augur::analysis::SignalAggregator aggregator;
    aggregator.set_weight("B", 3.0);
    EXPECT_DOUBLE_EQ(aggregator.weight("B"), 3.0);
    EXPECT_DOUBLE_EQ(aggregator.weight("A"), 1.0);

    auto consensus = aggregator.aggregate({{"A", Signal::buy(1.0)}, {"B", Signal::sell(1.0)}});
    EXPECT_NEAR(consensus.score, -0.5, 1e-12);
    EXPECT_EQ(consensus.action, augur::analysis::Action::SELL);

    aggregator.set_threshold(0.6);
    EXPECT_EQ(aggregator.aggregate({{"A", Signal::buy(1.0)}, {"B", Signal::sell(1.0)}}).action,
              augur::analysis::Action::HOLD);

    aggregator.set_weight("A", 0.0);
    aggregator.set_weight("B", 0.0);
    EXPECT_EQ(aggregator.aggregate({{"A", Signal::buy(1.0)}, {"B", Signal::sell(1.0)}}).action,
              augur::analysis::Action::HOLD);

    EXPECT_THROW(aggregator.set_threshold(0.0), std::invalid_argument);
    EXPECT_THROW(aggregator.set_threshold(1.5), std::invalid_argument);
    EXPECT_THROW(aggregator.set_weight("A", -1.0), std::invalid_argument);
}

TEST(SignalAggregatorTest, FromConfig) {
    augur::utils::Config config;
    config.set("consensus.threshold", 0.5);
    config.set("weight.MACD", 2);

    auto aggregator = augur::analysis::SignalAggregator::from_config(config);
    EXPECT_DOUBLE_EQ(aggregator.threshold(), 0.5);
    EXPECT_DOUBLE_EQ(aggregator.weight("MACD"), 2.0);
    EXPECT_DOUBLE_EQ(aggregator.weight("Fractal"), 1.0);

    config.set("weight.Fractal", "heavy");
    EXPECT_THROW(augur::analysis::SignalAggregator::from_config(config), std::invalid_argument);
}

// Test MarketSnapshot
TEST(MarketSnapshotTest, FromManualIndicators) {
    PriceSeries series = make_series("SNAP", {100.0, 102.0});
    augur::indicators::IndicatorSet set;
    set.macd = {0.0, 0.4};
    set.signal_line = {0.0, 0.1};
    set.middle_band = {100.0, 100.0};
    set.std_dev = {0.5, 0.5};
    set.upper_band = {101.0, 101.0};
    set.lower_band = {99.0, 99.0};
    set.rsi = {50.0, 65.0};

    auto snapshot = augur::analysis::MarketSnapshot::from_series(
        augur::indicators::EnrichedSeries(series, set));

    EXPECT_DOUBLE_EQ(snapshot.last_close, 102.0);
    EXPECT_DOUBLE_EQ(snapshot.last_volume, 501.0);
    EXPECT_NEAR(snapshot.change_pct, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(snapshot.macd, 0.4);
    EXPECT_DOUBLE_EQ(snapshot.rsi, 65.0);
    EXPECT_EQ(snapshot.band_position, augur::analysis::BandPosition::ABOVE_UPPER);
    EXPECT_EQ(augur::analysis::to_string(snapshot.band_position), "Above upper band");
}

TEST(MarketSnapshotTest, WithoutIndicators) {
    auto snapshot = augur::analysis::MarketSnapshot::from_series(
        augur::indicators::EnrichedSeries(make_series("SNAP", {100.0})));

    EXPECT_DOUBLE_EQ(snapshot.last_close, 100.0);
    EXPECT_TRUE(std::isnan(snapshot.change_pct));
    EXPECT_TRUE(std::isnan(snapshot.macd));
    EXPECT_TRUE(std::isnan(snapshot.rsi));
    EXPECT_EQ(snapshot.band_position, augur::analysis::BandPosition::UNKNOWN);
}

// Test SymbolAnalyzer
class AnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider = std::make_shared<StaticProvider>();
        provider->series.emplace("WAVE", make_series("WAVE", wave(120)));
        provider->series.emplace("SHORT", make_series("SHORT", {100.0, 100.0}));
        analyzer = std::make_unique<augur::analysis::SymbolAnalyzer>(provider);
    }

    std::shared_ptr<StaticProvider> provider;
    std::unique_ptr<augur::analysis::SymbolAnalyzer> analyzer;
};

TEST_F(AnalyzerTest, StrategyManagement) {
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Up", Signal::buy(1.0)));
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Down", Signal::sell(1.0)));
    EXPECT_EQ(analyzer->strategy_names(), (std::vector<std::string>{"Up", "Down"}));

    // Same name replaces
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Down", Signal::sell(0.5)));
    EXPECT_EQ(analyzer->strategy_names().size(), 2);

    ASSERT_NE(analyzer->get_strategy("Up"), nullptr);
    EXPECT_EQ(analyzer->get_strategy("Missing"), nullptr);

    analyzer->remove_strategy("Up");
    EXPECT_EQ(analyzer->strategy_names(), (std::vector<std::string>{"Down"}));

    EXPECT_THROW(analyzer->add_strategy(nullptr), std::invalid_argument);
}

TEST_F(AnalyzerTest, DisabledStrategiesAreSkipped) {
    auto up = std::make_shared<FixedStrategy>("Up", Signal::buy(1.0));
    analyzer->add_strategy(up);
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Flat", Signal::neutral()));
    up->set_enabled(false);

    auto report = analyzer->analyze_symbol("WAVE");
    EXPECT_EQ(report.signals.count("Up"), 0);
    EXPECT_EQ(report.signals.count("Flat"), 1);
    EXPECT_EQ(report.consensus.action, augur::analysis::Action::HOLD);
}

TEST_F(AnalyzerTest, AnalyzeSymbolWithDefaultStrategies) {
    for (const auto& s : augur::strategy::make_default_strategies()) {
        analyzer->add_strategy(s);
    }

    auto report = analyzer->analyze_symbol("WAVE");
    EXPECT_EQ(report.symbol, "WAVE");
    EXPECT_EQ(report.bar_count, 120);
    EXPECT_TRUE(report.indicators_available);
    EXPECT_FALSE(report.error.has_value());
    EXPECT_EQ(report.signals.size(), 5);
    EXPECT_DOUBLE_EQ(report.snapshot.last_close, wave(120).back());
    EXPECT_FALSE(std::isnan(report.snapshot.rsi));
    EXPECT_NE(report.snapshot.band_position, augur::analysis::BandPosition::UNKNOWN);

    const auto& c = report.consensus;
    EXPECT_EQ(c.buy_votes + c.sell_votes + c.neutral_votes, 5);
    EXPECT_GE(c.score, -1.0);
    EXPECT_LE(c.score, 1.0);
}

TEST_F(AnalyzerTest, ShortHistoryHolds) {
    for (const auto& s : augur::strategy::make_default_strategies()) {
        analyzer->add_strategy(s);
    }

    auto report = analyzer->analyze_symbol("SHORT");
    EXPECT_EQ(report.bar_count, 2);
    // Only MACD has enough bars and an unchanged close cannot cross
    for (const auto& [name, signal] : report.signals) {
        EXPECT_EQ(signal, Signal::neutral()) << name;
    }
    EXPECT_EQ(report.consensus.action, augur::analysis::Action::HOLD);
}

TEST_F(AnalyzerTest, UnknownSymbolGivesEmptyReport) {
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Up", Signal::buy(1.0)));

    auto report = analyzer->analyze_symbol("NONE");
    EXPECT_EQ(report.symbol, "NONE");
    EXPECT_EQ(report.bar_count, 0);
    EXPECT_FALSE(report.indicators_available);
    EXPECT_TRUE(std::isnan(report.snapshot.last_close));
}

TEST_F(AnalyzerTest, ScreenKeepsOrderAndIsolatesFailures) {
    for (const auto& s : augur::strategy::make_default_strategies()) {
        analyzer->add_strategy(s);
    }

    const std::vector<std::string> symbols = {"WAVE", "THROW", "SHORT", "NONE"};
    for (bool parallel : {true, false}) {
        augur::analysis::AnalyzerConfiguration config;
        config.parallel_screening = parallel;
        analyzer->configure(config);

        auto reports = analyzer->screen(symbols);
        ASSERT_EQ(reports.size(), symbols.size());
        for (size_t i = 0; i < symbols.size(); ++i) {
            EXPECT_EQ(reports[i].symbol, symbols[i]);
        }
        EXPECT_FALSE(reports[0].error.has_value());
        ASSERT_TRUE(reports[1].error.has_value());
        EXPECT_EQ(*reports[1].error, "feed unavailable");
        EXPECT_EQ(reports[1].consensus.action, augur::analysis::Action::HOLD);
        EXPECT_EQ(reports[2].bar_count, 2);
    }
}

TEST_F(AnalyzerTest, ScreenMatchesSingleAnalysis) {
    for (const auto& s : augur::strategy::make_default_strategies()) {
        analyzer->add_strategy(s);
    }

    auto single = analyzer->analyze_symbol("WAVE");
    auto screened = analyzer->screen({"WAVE", "WAVE"});
    for (const auto& report : screened) {
        EXPECT_EQ(report.signals, single.signals);
        EXPECT_DOUBLE_EQ(report.consensus.score, single.consensus.score);
    }
}

TEST_F(AnalyzerTest, ReplacingAggregatorChangesConsensus) {
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Up", Signal::buy(0.3)));
    analyzer->add_strategy(std::make_shared<FixedStrategy>("Flat", Signal::neutral()));

    // Score 0.15 is under the default threshold
    EXPECT_DOUBLE_EQ(analyzer->aggregator().threshold(), augur::analysis::SignalAggregator::DEFAULT_THRESHOLD);
    EXPECT_EQ(analyzer->analyze_symbol("WAVE").consensus.action, augur::analysis::Action::HOLD);

    analyzer->set_aggregator(augur::analysis::SignalAggregator(0.1));
    EXPECT_DOUBLE_EQ(analyzer->aggregator().threshold(), 0.1);
    auto report = analyzer->analyze_symbol("WAVE");
    EXPECT_EQ(report.consensus.action, augur::analysis::Action::BUY);
    EXPECT_NEAR(report.consensus.score, 0.15, 1e-12);
}

// Test report JSON
TEST(ReportJsonTest, ParsesBackWithEscapedSymbolAndNulls) {
    augur::analysis::AnalysisReport report;
    report.symbol = "A\"B\\C";
    report.bar_count = 3;
    report.error = "line one\nline two";
    report.signals["MACD"] = Signal::sell(0.25);
    report.signals["Fibonacci"] = Signal::neutral();
    report.consensus.action = augur::analysis::Action::SELL;
    report.consensus.score = -0.5;
    report.consensus.sell_votes = 1;
    report.consensus.neutral_votes = 1;

    const std::string text = augur::analysis::to_json(report);
    EXPECT_EQ(text.find('\n'), std::string::npos);

    auto parsed = nlohmann::json::parse(text);
    EXPECT_EQ(parsed["symbol"], "A\"B\\C");
    EXPECT_EQ(parsed["bars"], 3);
    EXPECT_EQ(parsed["indicators"], false);
    EXPECT_EQ(parsed["error"], "line one\nline two");

    // Default snapshot values are NaN
    EXPECT_TRUE(parsed["snapshot"]["close"].is_null());
    EXPECT_TRUE(parsed["snapshot"]["rsi"].is_null());
    EXPECT_EQ(parsed["snapshot"]["band_position"], augur::analysis::to_string(augur::analysis::BandPosition::UNKNOWN));

    EXPECT_EQ(parsed["signals"]["MACD"]["sell"], true);
    EXPECT_EQ(parsed["signals"]["MACD"]["buy"], false);
    EXPECT_DOUBLE_EQ(parsed["signals"]["MACD"]["strength"].get<double>(), 0.25);
    EXPECT_EQ(parsed["signals"]["Fibonacci"]["buy"], false);

    EXPECT_EQ(parsed["consensus"]["action"], "SELL");
    EXPECT_DOUBLE_EQ(parsed["consensus"]["score"].get<double>(), -0.5);
    EXPECT_EQ(parsed["consensus"]["sell_votes"], 1);
    EXPECT_EQ(parsed["consensus"]["buy_votes"], 0);
}

TEST(AnalyzerConfigurationTest, FromConfig) {
    augur::utils::Config config;
    config.set("period", "6mo");
    config.set("screen.parallel", "no");

    auto parsed = augur::analysis::AnalyzerConfiguration::from_config(config);
    EXPECT_EQ(parsed.period, "6mo");
    EXPECT_EQ(parsed.interval, "1d");
    EXPECT_FALSE(parsed.parallel_screening);
}

TEST(AnalyzerWithoutProviderTest, AnalyzeSymbolThrows) {
    augur::analysis::SymbolAnalyzer analyzer(nullptr);
    EXPECT_THROW(analyzer.analyze_symbol("AAPL"), std::logic_error);

    // A provided series still works
    auto report = analyzer.analyze(make_series("LOCAL", wave(30)));
    EXPECT_EQ(report.bar_count, 30);
    EXPECT_TRUE(report.signals.empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
