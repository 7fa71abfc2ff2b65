#include "model/confidence.hpp"
#include <algorithm>
#include <cmath>

namespace gridedge {

std::pair<double, double> mc_ci_normal(double p_hat, int n, double z) {
    double p = std::clamp(p_hat, 0.0, 1.0);
    if (n <= 0) {
        return {p, p};
    }
    double se = std::sqrt(p * (1.0 - p) / static_cast<double>(n));
    double lo = std::max(0.0, p - z * se);
    double hi = std::min(1.0, p + z * se);
    return {lo, hi};
}

} // namespace gridedge
