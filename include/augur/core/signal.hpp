#pragma once
#include <string>

namespace augur::core {
    enum class SignalType {
        BUY,
        SELL,
        NEUTRAL
    };

    // Output of one strategy over one series snapshot. A single direction
    // field keeps buy and sell mutually exclusive.
    struct Signal {
        SignalType type;
        double strength = 0.0; // 0.0 to 1.0, except raw MACD magnitudes
        
        Signal();
        Signal(SignalType t, double s);

        static Signal neutral();
        static Signal buy(double strength);
        static Signal sell(double strength);

        bool is_buy() const { return type == SignalType::BUY; }
        bool is_sell() const { return type == SignalType::SELL; }
        bool is_neutral() const { return type == SignalType::NEUTRAL; }

        bool operator==(const Signal& other) const {
            return type == other.type && strength == other.strength;
        }
        bool operator!=(const Signal& other) const { return !(*this == other); }
    };

    // "BUY", "SELL" or "HOLD"
    std::string to_string(SignalType type);
}

 // namespace augur::core
