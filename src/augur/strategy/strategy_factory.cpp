// src/augur/strategy/strategy_factory.cpp
#include "augur/strategy/strategy_factory.hpp"
#include "augur/strategies/macd_strategy.hpp"
#include "augur/strategies/bollinger_strategy.hpp"
#include "augur/strategies/fibonacci_strategy.hpp"
#include "augur/strategies/fractal_strategy.hpp"
#include "augur/strategies/resistance_strategy.hpp"

namespace augur {
namespace strategy {

// Define static members
std::unordered_map<std::string, StrategyFactory::StrategyCreator> StrategyFactory::creators_;
std::mutex StrategyFactory::factory_mutex_;

void register_default_strategies() {
    StrategyFactory::register_type<strategies::MACDStrategy>(strategies::MACDStrategy::NAME);
    StrategyFactory::register_type<strategies::BollingerStrategy>(strategies::BollingerStrategy::NAME);
    StrategyFactory::register_type<strategies::FibonacciStrategy>(strategies::FibonacciStrategy::NAME);
    StrategyFactory::register_type<strategies::FractalStrategy>(strategies::FractalStrategy::NAME);
    StrategyFactory::register_type<strategies::ResistanceStrategy>(strategies::ResistanceStrategy::NAME);
}

std::vector<StrategyPtr> make_default_strategies() {
    return {
        std::make_shared<strategies::MACDStrategy>(),
        std::make_shared<strategies::BollingerStrategy>(),
        std::make_shared<strategies::FibonacciStrategy>(),
        std::make_shared<strategies::FractalStrategy>(),
        std::make_shared<strategies::ResistanceStrategy>()
    };
}

} // namespace strategy
} // namespace augur
