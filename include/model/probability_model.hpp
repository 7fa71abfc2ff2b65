#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "common/types.hpp"
#include "model/random_source.hpp"

namespace gridedge {

// Standard normal CDF via the error function
double normal_cdf(double z);

/**
 * P(X > line) and P(X < line) for X ~ N(mean, sigma^2).
 * With sigma <= 0 the distribution is a point mass at mean:
 * 1.0 on the strict side, 0.0 on the other, 0.5 when mean == line.
 */
double prob_over_normal(double mean, double sigma, double line);
double prob_under_normal(double mean, double sigma, double line);

/**
 * Monte Carlo estimate of P(X > threshold) from n draws of N(mean, sigma^2).
 * Throws InvalidInputError when n <= 0. sigma <= 0 follows the point-mass
 * policy of prob_over_normal without drawing.
 */
double simulate_prob_over(double mean, double sigma, double threshold, int n, RandomSource& rng);

// P(home margin > spread)
double simulate_cover_spread(double mean_diff, double sigma, double spread, int n,
                             std::optional<uint64_t> seed = std::nullopt);
double simulate_cover_spread(double mean_diff, double sigma, double spread, int n,
                             RandomSource& rng);

// P(total points > line)
double simulate_total_over(double mean_total, double sigma_total, double line, int n,
                           std::optional<uint64_t> seed = std::nullopt);
double simulate_total_over(double mean_total, double sigma_total, double line, int n,
                           RandomSource& rng);

/**
 * Normal outcome model over a rating map.
 *
 *   margin = home - away ~ N(R_home - R_away + hfa, sigma_diff^2)
 *   total  = home + away ~ N(league_mean_total, sigma_total^2)
 */
class ProbabilityModel {
public:
    ProbabilityModel(RatingMap ratings, double hfa_points, double sigma_diff, double sigma_total);

    double rating(const std::string& team) const;

    // Expected home margin
    double mean_diff(const std::string& home, const std::string& away) const;

    double win_probability(const std::string& home, const std::string& away) const;

    // P(margin > spread_line)
    double cover_probability(const std::string& home, const std::string& away, double spread_line) const;

    double over_probability(double total_line, double league_mean_total) const;

    double hfa_points() const { return hfa_; }
    double sigma_diff() const { return sigma_diff_; }
    double sigma_total() const { return sigma_total_; }
    const RatingMap& ratings() const { return ratings_; }

private:
    RatingMap ratings_;
    double hfa_;
    double sigma_diff_;
    double sigma_total_;
};

} // namespace gridedge
