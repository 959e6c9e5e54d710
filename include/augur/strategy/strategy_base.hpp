// include/augur/strategy/strategy_base.hpp
#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include "augur/indicators/indicator_set.hpp"
#include "augur/core/signal.hpp"

namespace augur {
namespace strategy {

class StrategyBase {
protected:
    std::string name_;
    bool enabled_ = true;
    std::unordered_map<std::string, std::string> config_;

    // Parses a numeric parameter, throwing std::invalid_argument naming the key
    double get_number(const std::string& key, double default_value) const;

public:
    explicit StrategyBase(std::string name) : name_(std::move(name)) {}
    virtual ~StrategyBase() = default;

    // Pure function of the snapshot: no state is carried between calls
    virtual core::Signal generate_signals(const indicators::EnrichedSeries& series) const = 0;

    // Fewer bars than this always produce Signal::neutral()
    virtual size_t min_bars() const = 0;
    
    // Re-reads parameters from the configuration map
    virtual void initialize() {}
    
    virtual void configure(const std::unordered_map<std::string, std::string>& config) {
        config_ = config;
        initialize();
    }
    
    std::string get_config(const std::string& key, const std::string& default_value = "") const {
        auto it = config_.find(key);
        return it != config_.end() ? it->second : default_value;
    }

    // Accessors
    const std::string& name() const { return name_; }
    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }
};

using StrategyPtr = std::shared_ptr<StrategyBase>;

} // namespace strategy
} // namespace augur
