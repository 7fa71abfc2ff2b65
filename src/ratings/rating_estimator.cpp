#include "ratings/rating_estimator.hpp"
#include "config/config.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace gridedge {

std::unique_ptr<RatingEstimator> make_rating_estimator(
    const RatingsConfig& ratings,
    const ModelConfig& model
) {
    if (ratings.method == "ridge") {
        RidgeFitConfig cfg;
        cfg.hfa_points = model.hfa_points;
        cfg.l2_lambda = ratings.l2_lambda;
        cfg.enforce_sum_zero = ratings.enforce_sum_zero;
        spdlog::info("Rating estimator: ridge (lambda={:.2f}, sum_zero={})",
                     cfg.l2_lambda, cfg.enforce_sum_zero);
        return std::make_unique<RidgeRatingFit>(cfg);
    }

    if (ratings.method == "elo") {
        EloFitConfig cfg;
        cfg.k = ratings.elo_k;
        cfg.hfa_points = model.hfa_points;
        cfg.iters = ratings.elo_iters;
        cfg.scale_pts = ratings.elo_scale_pts;
        cfg.use_mov = ratings.mov_enabled;
        cfg.mov_scale_pts = ratings.mov_scale_pts;
        cfg.mov_cap = ratings.mov_cap;
        spdlog::info("Rating estimator: elo (k={:.1f}, iters={}, mov={})",
                     cfg.k, cfg.iters, cfg.use_mov);
        return std::make_unique<EloRatingFit>(cfg);
    }

    throw InvalidInputError("Unknown rating method: " + ratings.method);
}

} // namespace gridedge
