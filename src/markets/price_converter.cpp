#include "markets/price_converter.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gridedge {

double american_to_decimal(AmericanOdds american) {
    if (american == 0) {
        throw InvalidOddsError("American odds cannot be 0");
    }
    if (american > 0) {
        return 1.0 + american / 100.0;
    }
    // Negate in double: -INT_MIN does not fit in an int
    return 1.0 + 100.0 / -static_cast<double>(american);
}

double implied_probability(AmericanOdds american) {
    if (american == 0) {
        throw InvalidOddsError("American odds cannot be 0");
    }
    if (american > 0) {
        return 100.0 / (american + 100.0);
    }
    double a = -static_cast<double>(american);
    return a / (a + 100.0);
}

AmericanOdds decimal_to_american(double decimal_price) {
    if (!(decimal_price > 1.0)) {
        throw InvalidOddsError(fmt::format("decimal price must be > 1.0, got {}", decimal_price));
    }
    double b = decimal_price - 1.0;
    if (b >= 1.0) {
        return static_cast<AmericanOdds>(std::lround(b * 100.0));
    }
    return static_cast<AmericanOdds>(-std::lround(100.0 / b));
}

double breakeven_probability(double decimal_price) {
    if (!(decimal_price > 1.0)) {
        throw InvalidOddsError(fmt::format("decimal price must be > 1.0, got {}", decimal_price));
    }
    return 1.0 / decimal_price;
}

std::pair<double, double> remove_vig_two_way(double p_a, double p_b) {
    if (!(p_a > 0.0) || !(p_b > 0.0)) {
        throw InvalidProbabilityError(
            fmt::format("probabilities must be > 0, got p_a={} p_b={}", p_a, p_b));
    }
    double s = p_a + p_b;
    return {p_a / s, p_b / s};
}

} // namespace gridedge
