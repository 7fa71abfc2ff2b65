#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace gridedge {

struct RatingsConfig;
struct ModelConfig;

// Output of a rating fit
struct RatingFit {
    RatingMap ratings;
    TeamIndex team_index;    // Column used per team (ridge only, diagnostics)
};

/**
 * Base class for rating-inference strategies.
 * Estimators read the game list and the optional starting map and return a
 * new map; neither input is modified.
 */
class RatingEstimator {
public:
    explicit RatingEstimator(const std::string& name) : name_(name) {}
    virtual ~RatingEstimator() = default;

    virtual RatingFit fit(
        const std::vector<GameResult>& results,
        const RatingMap& start_ratings = {}
    ) const = 0;

    const std::string& name() const { return name_; }

protected:
    std::string name_;
};

// Config structs defined outside the classes so they can be default arguments
struct RidgeFitConfig {
    double hfa_points{2.0};
    double l2_lambda{4.0};          // Gaussian prior precision, larger = stronger shrink
    bool enforce_sum_zero{true};
};

/**
 * Bayesian (ridge / MAP) fit of team net strength from point differentials.
 *
 *   y = home_pts - away_pts - hfa  ~  R_home - R_away + eps
 *   prior R ~ N(0, tau^2 I)  ->  ridge penalty lambda
 *
 * Solves (X'X + lambda*I) beta = X'y in one shot. Starting ratings are
 * accepted for interface parity and ignored.
 */
class RidgeRatingFit : public RatingEstimator {
public:
    explicit RidgeRatingFit(const RidgeFitConfig& config = RidgeFitConfig{});

    RatingFit fit(
        const std::vector<GameResult>& results,
        const RatingMap& start_ratings = {}
    ) const override;

    const RidgeFitConfig& config() const { return config_; }

    // Sorted team set -> column
    static TeamIndex build_team_index(const std::vector<GameResult>& results);

private:
    RidgeFitConfig config_;
};

struct EloFitConfig {
    double k{20.0};                 // Update size in points per unit of error
    double hfa_points{2.0};
    int iters{2};                   // Full passes over the game list
    double scale_pts{13.0};         // Larger = flatter win curve
    bool use_mov{true};
    double mov_scale_pts{7.0};
    double mov_cap{2.0};
};

/**
 * Elo-style fitter on final scores with margin-of-victory weighting.
 *
 * Per game:
 *   diff = (R_home + HFA) - R_away
 *   err  = actual - 1 / (1 + exp(-1.7 * diff / scale))
 *   mult = min(cap, 1 + ln(1 + |margin| / mov_scale))   (1 when MOV is off)
 *   R_home += k*mult*err,  R_away -= k*mult*err
 *
 * The full list is replayed `iters` times in the given order. Callers wanting
 * a single chronological pass pre-sort and set iters=1.
 */
class EloRatingFit : public RatingEstimator {
public:
    explicit EloRatingFit(const EloFitConfig& config = EloFitConfig{});

    RatingFit fit(
        const std::vector<GameResult>& results,
        const RatingMap& start_ratings = {}
    ) const override;

    const EloFitConfig& config() const { return config_; }

    double expected_home_score(double diff_pts) const;
    double mov_multiplier(int margin) const;

private:
    EloFitConfig config_;
};

/**
 * Recenter to mean 0 and rescale to the given population standard deviation.
 * A zero-variance map is returned centered but unscaled.
 */
RatingMap normalize_ratings(const RatingMap& ratings, double target_std = 3.0);

// Build the estimator selected by `ratings.method`
std::unique_ptr<RatingEstimator> make_rating_estimator(
    const RatingsConfig& ratings,
    const ModelConfig& model
);

} // namespace gridedge
