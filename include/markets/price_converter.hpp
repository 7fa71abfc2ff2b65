#pragma once

#include <utility>
#include "common/types.hpp"
#include "common/errors.hpp"

namespace gridedge {

/**
 * Conversions between sportsbook price formats.
 *
 *   American  +150  ->  decimal 2.50   ->  implied 0.400
 *   American  -120  ->  decimal 1.8333 ->  implied 0.5454
 *
 * All functions throw InvalidOddsError for a zero American price.
 */
double american_to_decimal(AmericanOdds american);

double implied_probability(AmericanOdds american);

// Inverse of american_to_decimal, rounded to the nearest whole price
AmericanOdds decimal_to_american(double decimal_price);

// Win probability at which a bet at this price has zero expectation
double breakeven_probability(double decimal_price);

/**
 * Normalize the two implied probabilities of a two-way market so they sum
 * to 1.0, removing the bookmaker margin. Ordering of the inputs is kept.
 * Throws InvalidProbabilityError if either input is <= 0.
 */
std::pair<double, double> remove_vig_two_way(double p_a, double p_b);

} // namespace gridedge
