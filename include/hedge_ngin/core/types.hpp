// include/hedge_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace hedge_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Trading dates are stored as UTC midnight
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Share quantity. Whole shares only
 */
using Quantity = long long;

/**
 * @brief Daily market data bar
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

}  // namespace hedge_ngin
