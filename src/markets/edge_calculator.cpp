#include "markets/edge_calculator.hpp"
#include <fmt/format.h>

namespace gridedge {

namespace {

void require_open_unit(const char* name, double p) {
    if (!(p > 0.0 && p < 1.0)) {
        throw InvalidInputError(fmt::format("{} must be in (0,1), got {}", name, p));
    }
}

void require_decimal_price(double decimal_price) {
    if (!(decimal_price > 1.0)) {
        throw InvalidInputError(fmt::format("decimal_price must be > 1.0, got {}", decimal_price));
    }
}

} // namespace

EdgeResult ev_and_edge(double model_prob, double fair_prob, double decimal_price) {
    require_open_unit("model_prob", model_prob);
    require_open_unit("fair_prob", fair_prob);
    require_decimal_price(decimal_price);

    double b = decimal_price - 1.0;
    double q = 1.0 - model_prob;

    EdgeResult result;
    result.ev_per_dollar = model_prob * b - q;
    result.edge = model_prob - fair_prob;
    return result;
}

double kelly_fractional(double p_win, double decimal_price, double bankroll, double fraction) {
    require_open_unit("p_win", p_win);
    require_decimal_price(decimal_price);
    if (!(bankroll >= 0.0)) {
        throw InvalidInputError(fmt::format("bankroll must be >= 0, got {}", bankroll));
    }
    if (!(fraction > 0.0 && fraction <= 1.0)) {
        throw InvalidInputError(fmt::format("fraction must be in (0,1], got {}", fraction));
    }

    // At or below breakeven: compare against 1/d directly, the numerator
    // b*p - q rounds to a tiny positive value for many prices
    if (p_win <= 1.0 / decimal_price) {
        return 0.0;
    }

    double b = decimal_price - 1.0;
    double q = 1.0 - p_win;
    double edge = b * p_win - q;  // Kelly numerator
    if (edge <= 0.0) {
        return 0.0;
    }
    return bankroll * fraction * (edge / b);
}

} // namespace gridedge
