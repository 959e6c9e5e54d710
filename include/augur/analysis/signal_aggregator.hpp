#pragma once
#include <augur/core/signal.hpp>
#include <augur/utils/config.hpp>
#include <map>
#include <string>
#include <unordered_map>

namespace augur::analysis {

// Strategy name -> signal, ordered by name for stable output
using SignalMap = std::map<std::string, core::Signal>;

enum class Action {
    BUY,
    SELL,
    HOLD
};

std::string to_string(Action action);

struct Consensus {
    Action action = Action::HOLD;
    double score = 0.0;       // weighted direction in [-1, 1]
    double confidence = 0.0;  // |score|
    int buy_votes = 0;
    int sell_votes = 0;
    int neutral_votes = 0;
};

// Folds per-strategy signals into one recommendation. Each signal contributes
// weight * direction * min(1, strength); the sum is divided by the total
// weight of the strategies present.
class SignalAggregator {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.2;

    SignalAggregator() = default;
    explicit SignalAggregator(double threshold);

    void set_threshold(double threshold);
    double threshold() const { return threshold_; }

    // Weight for a strategy name; unlisted strategies weigh 1.0
    void set_weight(const std::string& strategy_name, double weight);
    double weight(const std::string& strategy_name) const;

    Consensus aggregate(const SignalMap& signals) const;

    // consensus.threshold and weight.<Strategy> keys
    static SignalAggregator from_config(const utils::Config& config);

private:
    double threshold_ = DEFAULT_THRESHOLD;
    std::unordered_map<std::string, double> weights_;
};

} // namespace augur::analysis
