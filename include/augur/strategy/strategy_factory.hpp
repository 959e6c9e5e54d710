// include/augur/strategy/strategy_factory.hpp
#pragma once
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <algorithm>
#include "augur/strategy/strategy_base.hpp"

namespace augur {
namespace strategy {

class StrategyFactory {
private:
    using StrategyCreator = std::function<StrategyPtr()>;
    static std::unordered_map<std::string, StrategyCreator> creators_;
    static std::mutex factory_mutex_;

public:
    // Register a strategy type with the factory
    template<typename T>
    static void register_type(const std::string& type_name) {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        creators_[type_name] = []() -> StrategyPtr { 
            return std::make_shared<T>(); 
        };
    }
    
    // Create a strategy instance by type name, nullptr when unknown
    static StrategyPtr create_strategy(const std::string& type_name) {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        auto it = creators_.find(type_name);
        if (it != creators_.end()) {
            return it->second();
        }
        return nullptr;
    }
    
    // Registered type names, sorted
    static std::vector<std::string> get_registered_types() {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        std::vector<std::string> types;
        for (const auto& [type, _] : creators_) {
            types.push_back(type);
        }
        std::sort(types.begin(), types.end());
        return types;
    }

    static void clear() {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        creators_.clear();
    }
};

// Registers MACD, Bollinger, Fibonacci, Fractal and Resistance
void register_default_strategies();

// One instance of each default strategy, in that order
std::vector<StrategyPtr> make_default_strategies();

} // namespace strategy
} // namespace augur
