#include "ratings/rating_estimator.hpp"
#include "common/errors.hpp"
#include <set>
#include <Eigen/Dense>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gridedge {

RidgeRatingFit::RidgeRatingFit(const RidgeFitConfig& config)
    : RatingEstimator("ridge")
    , config_(config)
{
    if (!(config_.l2_lambda > 0.0)) {
        throw InvalidInputError(fmt::format("l2_lambda must be > 0, got {}", config_.l2_lambda));
    }
}

TeamIndex RidgeRatingFit::build_team_index(const std::vector<GameResult>& results) {
    std::set<std::string> teams;
    for (const auto& g : results) {
        teams.insert(g.home_team);
        teams.insert(g.away_team);
    }

    TeamIndex idx;
    int col = 0;
    for (const auto& t : teams) {
        idx[t] = col++;
    }
    return idx;
}

RatingFit RidgeRatingFit::fit(
    const std::vector<GameResult>& results,
    const RatingMap& /*start_ratings*/
) const {
    RatingFit out;
    if (results.empty()) {
        return out;
    }

    out.team_index = build_team_index(results);
    const auto n_teams = static_cast<Eigen::Index>(out.team_index.size());
    const auto n_games = static_cast<Eigen::Index>(results.size());

    // Design matrix: +1 home column, -1 away column
    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(n_games, n_teams);
    Eigen::VectorXd y(n_games);

    for (Eigen::Index row = 0; row < n_games; ++row) {
        const auto& g = results[static_cast<size_t>(row)];
        X(row, out.team_index.at(g.home_team)) = 1.0;
        X(row, out.team_index.at(g.away_team)) = -1.0;
        y(row) = static_cast<double>(g.home_points) - static_cast<double>(g.away_points)
                 - config_.hfa_points;
    }

    // lambda > 0 keeps A symmetric positive-definite even with fewer games than teams
    Eigen::MatrixXd A = X.transpose() * X;
    A.diagonal().array() += config_.l2_lambda;
    Eigen::VectorXd b = X.transpose() * y;
    Eigen::VectorXd beta = A.ldlt().solve(b);

    if (config_.enforce_sum_zero) {
        beta.array() -= beta.mean();
    }

    for (const auto& [team, col] : out.team_index) {
        out.ratings[team] = beta(col);
    }

    spdlog::debug("Ridge fit: {} games, {} teams, lambda={:.2f}, hfa={:.2f}",
                  n_games, n_teams, config_.l2_lambda, config_.hfa_points);
    return out;
}

} // namespace gridedge
