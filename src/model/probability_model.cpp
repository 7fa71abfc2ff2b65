#include "model/probability_model.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <utility>
#include <fmt/format.h>

namespace gridedge {

double normal_cdf(double z) {
    return 0.5 * (1.0 + std::erf(z / std::sqrt(2.0)));
}

double prob_over_normal(double mean, double sigma, double line) {
    if (sigma <= 0.0) {
        if (mean > line) return 1.0;
        if (mean < line) return 0.0;
        return 0.5;
    }
    return 1.0 - normal_cdf((line - mean) / sigma);
}

double prob_under_normal(double mean, double sigma, double line) {
    if (sigma <= 0.0) {
        if (mean < line) return 1.0;
        if (mean > line) return 0.0;
        return 0.5;
    }
    return normal_cdf((line - mean) / sigma);
}

double simulate_prob_over(double mean, double sigma, double threshold, int n, RandomSource& rng) {
    if (n <= 0) {
        throw InvalidInputError(fmt::format("simulation count must be > 0, got {}", n));
    }
    if (sigma <= 0.0) {
        return prob_over_normal(mean, sigma, threshold);
    }

    std::normal_distribution<double> dist(mean, sigma);
    int hits = 0;
    for (int i = 0; i < n; ++i) {
        if (dist(rng.engine()) > threshold) {
            ++hits;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(n);
}

double simulate_cover_spread(double mean_diff, double sigma, double spread, int n,
                             std::optional<uint64_t> seed) {
    RandomSource rng(seed);
    return simulate_prob_over(mean_diff, sigma, spread, n, rng);
}

double simulate_cover_spread(double mean_diff, double sigma, double spread, int n,
                             RandomSource& rng) {
    return simulate_prob_over(mean_diff, sigma, spread, n, rng);
}

double simulate_total_over(double mean_total, double sigma_total, double line, int n,
                           std::optional<uint64_t> seed) {
    RandomSource rng(seed);
    return simulate_prob_over(mean_total, sigma_total, line, n, rng);
}

double simulate_total_over(double mean_total, double sigma_total, double line, int n,
                           RandomSource& rng) {
    return simulate_prob_over(mean_total, sigma_total, line, n, rng);
}

// ============================================================================
// ProbabilityModel
// ============================================================================

ProbabilityModel::ProbabilityModel(RatingMap ratings, double hfa_points,
                                   double sigma_diff, double sigma_total)
    : ratings_(std::move(ratings))
    , hfa_(hfa_points)
    , sigma_diff_(sigma_diff)
    , sigma_total_(sigma_total)
{
}

double ProbabilityModel::rating(const std::string& team) const {
    auto it = ratings_.find(team);
    return it != ratings_.end() ? it->second : 0.0;
}

double ProbabilityModel::mean_diff(const std::string& home, const std::string& away) const {
    return rating(home) - rating(away) + hfa_;
}

double ProbabilityModel::win_probability(const std::string& home, const std::string& away) const {
    return prob_over_normal(mean_diff(home, away), sigma_diff_, 0.0);
}

double ProbabilityModel::cover_probability(const std::string& home, const std::string& away,
                                           double spread_line) const {
    return prob_over_normal(mean_diff(home, away), sigma_diff_, spread_line);
}

double ProbabilityModel::over_probability(double total_line, double league_mean_total) const {
    return prob_over_normal(league_mean_total, sigma_total_, total_line);
}

} // namespace gridedge
