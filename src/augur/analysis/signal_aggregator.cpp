#include <augur/analysis/signal_aggregator.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace augur::analysis {

std::string to_string(Action action) {
    switch (action) {
        case Action::BUY:
            return "BUY";
        case Action::SELL:
            return "SELL";
        case Action::HOLD:
            break;
    }
    return "HOLD";
}

SignalAggregator::SignalAggregator(double threshold) {
    set_threshold(threshold);
}

void SignalAggregator::set_threshold(double threshold) {
    if (!(threshold > 0.0) || threshold > 1.0) {
        throw std::invalid_argument("consensus threshold must be in (0, 1]");
    }
    threshold_ = threshold;
}

void SignalAggregator::set_weight(const std::string& strategy_name, double weight) {
    if (!(weight >= 0.0) || !std::isfinite(weight)) {
        throw std::invalid_argument("weight for " + strategy_name + " must be a non-negative number");
    }
    weights_[strategy_name] = weight;
}

double SignalAggregator::weight(const std::string& strategy_name) const {
    auto it = weights_.find(strategy_name);
    return it != weights_.end() ? it->second : 1.0;
}

Consensus SignalAggregator::aggregate(const SignalMap& signals) const {
    Consensus consensus;
    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (const auto& [name, signal] : signals) {
        const double w = weight(name);
        total_weight += w;

        if (signal.is_buy()) {
            ++consensus.buy_votes;
            weighted_sum += w * std::clamp(signal.strength, 0.0, 1.0);
        } else if (signal.is_sell()) {
            ++consensus.sell_votes;
            weighted_sum -= w * std::clamp(signal.strength, 0.0, 1.0);
        } else {
            ++consensus.neutral_votes;
        }
    }

    if (total_weight <= 0.0) {
        return consensus;
    }

    consensus.score = weighted_sum / total_weight;
    consensus.confidence = std::abs(consensus.score);
    if (consensus.score >= threshold_) {
        consensus.action = Action::BUY;
    } else if (consensus.score <= -threshold_) {
        consensus.action = Action::SELL;
    }
    return consensus;
}

SignalAggregator SignalAggregator::from_config(const utils::Config& config) {
    SignalAggregator aggregator(config.get<double>("consensus.threshold", DEFAULT_THRESHOLD));
    for (const auto& [name, value] : config.with_prefix("weight")) {
        try {
            aggregator.set_weight(name, std::stod(value));
        } catch (const std::exception&) {
            throw std::invalid_argument("weight." + name + " is not a valid weight: " + value);
        }
    }
    return aggregator;
}

} // namespace augur::analysis
