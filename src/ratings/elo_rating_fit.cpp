#include "ratings/rating_estimator.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gridedge {

EloRatingFit::EloRatingFit(const EloFitConfig& config)
    : RatingEstimator("elo")
    , config_(config)
{
    if (!(config_.scale_pts > 0.0)) {
        throw InvalidInputError(fmt::format("scale_pts must be > 0, got {}", config_.scale_pts));
    }
    if (config_.use_mov && !(config_.mov_scale_pts > 0.0)) {
        throw InvalidInputError(fmt::format("mov_scale_pts must be > 0, got {}", config_.mov_scale_pts));
    }
}

double EloRatingFit::expected_home_score(double diff_pts) const {
    // Logistic proxy for the Normal CDF
    return 1.0 / (1.0 + std::exp(-(diff_pts / config_.scale_pts) * 1.7));
}

double EloRatingFit::mov_multiplier(int margin) const {
    if (!config_.use_mov) {
        return 1.0;
    }
    double m = 1.0 + std::log(1.0 + std::abs(margin) / config_.mov_scale_pts);
    return std::min(config_.mov_cap, m);
}

RatingFit EloRatingFit::fit(
    const std::vector<GameResult>& results,
    const RatingMap& start_ratings
) const {
    RatingFit out;
    out.ratings = start_ratings;
    auto& ratings = out.ratings;

    auto rating = [&ratings](const std::string& team) {
        auto it = ratings.find(team);
        return it != ratings.end() ? it->second : 0.0;
    };

    int passes = std::max(1, config_.iters);
    for (int pass = 0; pass < passes; ++pass) {
        for (const auto& g : results) {
            double actual = 0.5;
            if (g.home_points > g.away_points) actual = 1.0;
            else if (g.home_points < g.away_points) actual = 0.0;

            double diff = (rating(g.home_team) + config_.hfa_points) - rating(g.away_team);
            double err = actual - expected_home_score(diff);
            double delta = config_.k * mov_multiplier(g.margin()) * err;

            ratings[g.home_team] = rating(g.home_team) + delta;
            ratings[g.away_team] = rating(g.away_team) - delta;
        }
    }

    spdlog::debug("Elo fit: {} games x {} passes, k={:.1f}, mov={}",
                  results.size(), passes, config_.k, config_.use_mov);
    return out;
}

RatingMap normalize_ratings(const RatingMap& ratings, double target_std) {
    if (ratings.empty()) {
        return {};
    }

    double mean = 0.0;
    for (const auto& [team, r] : ratings) mean += r;
    mean /= static_cast<double>(ratings.size());

    RatingMap centered;
    double sq_sum = 0.0;
    for (const auto& [team, r] : ratings) {
        centered[team] = r - mean;
        sq_sum += (r - mean) * (r - mean);
    }

    double sd = std::sqrt(sq_sum / static_cast<double>(ratings.size()));
    if (sd <= 0.0) {
        return centered;
    }

    double scale = target_std / sd;
    for (auto& [team, r] : centered) {
        r *= scale;
    }
    return centered;
}

} // namespace gridedge
