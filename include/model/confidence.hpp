#pragma once

#include <utility>

namespace gridedge {

/**
 * Normal-approximation confidence interval for a Monte Carlo probability.
 * p_hat is clipped to [0,1]; n <= 0 gives a zero-width interval at p_hat.
 * z = 1.96 gives ~95% two-sided.
 */
std::pair<double, double> mc_ci_normal(double p_hat, int n, double z = 1.96);

} // namespace gridedge
