#include <augur/strategy/strategy_base.hpp>
#include <stdexcept>

namespace augur::strategy {

double StrategyBase::get_number(const std::string& key, double default_value) const {
    auto it = config_.find(key);
    if (it == config_.end() || it->second.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        return value;
    } catch (const std::exception&) {
        throw std::invalid_argument(name_ + ": parameter '" + key + "' is not a number: " + it->second);
    }
}

} // namespace augur::strategy
