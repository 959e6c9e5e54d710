// In src/augur/core/signal.cpp
#include "augur/core/signal.hpp"

namespace augur::core {
    Signal::Signal()
        : type(SignalType::NEUTRAL), strength(0.0) {
    }

    Signal::Signal(SignalType t, double s)
        : type(t), strength(t == SignalType::NEUTRAL ? 0.0 : s) {
    }

    Signal Signal::neutral() {
        return Signal();
    }

    Signal Signal::buy(double strength) {
        return Signal(SignalType::BUY, strength);
    }

    Signal Signal::sell(double strength) {
        return Signal(SignalType::SELL, strength);
    }

    std::string to_string(SignalType type) {
        switch (type) {
            case SignalType::BUY:
                return "BUY";
            case SignalType::SELL:
                return "SELL";
            case SignalType::NEUTRAL:
                break;
        }
        return "HOLD";
    }
}
