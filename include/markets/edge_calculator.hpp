#pragma once

#include "common/errors.hpp"

namespace gridedge {

struct EdgeResult {
    double ev_per_dollar{0.0};   // Expected profit per $1 staked
    double edge{0.0};            // model_prob - fair_prob, in probability points
};

/**
 * Expected value and edge of a single bet.
 *
 * b = decimal_price - 1 (net payout ratio)
 * ev_per_dollar = p*b - (1 - p)
 * edge = model_prob - fair_prob
 *
 * Requires both probabilities in (0,1) and decimal_price > 1.
 */
EdgeResult ev_and_edge(double model_prob, double fair_prob, double decimal_price);

/**
 * Fractional Kelly stake in bankroll units.
 *
 * Full Kelly: f* = (b*p - q) / b. The stake is bankroll * fraction * f*,
 * and exactly 0.0 whenever b*p - q <= 0 (never a negative stake).
 *
 * Requires p_win in (0,1), decimal_price > 1, bankroll >= 0, fraction in (0,1].
 */
double kelly_fractional(double p_win, double decimal_price, double bankroll, double fraction);

} // namespace gridedge
