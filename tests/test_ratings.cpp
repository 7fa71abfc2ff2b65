#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include "ratings/rating_estimator.hpp"
#include "config/config.hpp"
#include "common/errors.hpp"

using namespace gridedge;

namespace {

GameResult game(const std::string& home, const std::string& away, int hp, int ap) {
    GameResult g;
    g.date = "2024-12-01";
    g.home_team = home;
    g.away_team = away;
    g.home_points = hp;
    g.away_points = ap;
    return g;
}

double rating_sum(const RatingMap& r) {
    double s = 0.0;
    for (const auto& [team, v] : r) s += v;
    return s;
}

} // namespace

// ============================================================================
// Ridge (MAP) fit
// ============================================================================

class RidgeRatingFitTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.hfa_points = 2.0;
        config_.l2_lambda = 4.0;
        config_.enforce_sum_zero = true;
    }

    RidgeFitConfig config_;
};

TEST_F(RidgeRatingFitTest, SimpleSignal_BetterTeamRatesHigher) {
    std::vector<GameResult> results = {
        game("A", "B", 28, 20),
        game("A", "B", 24, 17),
        game("B", "A", 14, 21),
    };

    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit(results);

    EXPECT_GT(fit.ratings.at("A"), fit.ratings.at("B"));
    EXPECT_LT(std::abs(rating_sum(fit.ratings)), 1e-6);
}

TEST_F(RidgeRatingFitTest, TwoTeamClosedForm) {
    // Two teams, one game A beats B by 10 at home, hfa 2 -> y = 8
    // (X'X + 4I) = [[5,-1],[-1,5]], X'y = [8,-8] -> beta = [4/3, -4/3]
    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit({game("A", "B", 20, 10)});

    EXPECT_NEAR(fit.ratings.at("A"), 8.0 / 6.0, 1e-9);
    EXPECT_NEAR(fit.ratings.at("B"), -8.0 / 6.0, 1e-9);
}

TEST_F(RidgeRatingFitTest, SumToZeroAcrossLeague) {
    std::vector<GameResult> results = {
        game("Chiefs", "Bengals", 27, 24),
        game("Bills", "Chiefs", 20, 17),
        game("Bengals", "Ravens", 31, 10),
        game("Ravens", "Bills", 14, 28),
        game("Jets", "Bills", 3, 35),
    };

    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit(results);

    EXPECT_EQ(fit.ratings.size(), 5u);
    EXPECT_LT(std::abs(rating_sum(fit.ratings)), 1e-6);
    EXPECT_GT(fit.ratings.at("Bills"), fit.ratings.at("Jets"));
}

TEST_F(RidgeRatingFitTest, LargerMarginsRateStrictlyHigher) {
    std::vector<GameResult> narrow = {game("A", "B", 21, 20), game("B", "A", 17, 20)};
    std::vector<GameResult> wide = {game("A", "B", 35, 10), game("B", "A", 10, 31)};

    RidgeRatingFit fitter(config_);
    auto r1 = fitter.fit(narrow).ratings;
    auto r2 = fitter.fit(wide).ratings;

    EXPECT_GT(r1.at("A"), r1.at("B"));
    EXPECT_GT(r2.at("A") - r2.at("B"), r1.at("A") - r1.at("B"));
}

TEST_F(RidgeRatingFitTest, FewerGamesThanTeamsStillSolvable) {
    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit({game("A", "B", 24, 10), game("C", "D", 13, 13)});

    ASSERT_EQ(fit.ratings.size(), 4u);
    for (const auto& [team, r] : fit.ratings) {
        EXPECT_TRUE(std::isfinite(r)) << team;
    }
    EXPECT_GT(fit.ratings.at("A"), fit.ratings.at("B"));
}

TEST_F(RidgeRatingFitTest, TeamIndexIsSortedAndExposed) {
    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit({game("Zebras", "Ants", 10, 7), game("Moles", "Ants", 3, 9)});

    ASSERT_EQ(fit.team_index.size(), 3u);
    EXPECT_EQ(fit.team_index.at("Ants"), 0);
    EXPECT_EQ(fit.team_index.at("Moles"), 1);
    EXPECT_EQ(fit.team_index.at("Zebras"), 2);
}

TEST_F(RidgeRatingFitTest, WithoutSumZeroKeepsRawSolution) {
    config_.enforce_sum_zero = false;
    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit({game("A", "B", 20, 10), game("C", "A", 17, 14)});

    // Pairwise design with ridge prior already centers the solution
    EXPECT_NEAR(rating_sum(fit.ratings), 0.0, 1e-9);
}

TEST_F(RidgeRatingFitTest, EmptyInputReturnsEmptyMap) {
    RidgeRatingFit fitter(config_);
    auto fit = fitter.fit({});
    EXPECT_TRUE(fit.ratings.empty());
    EXPECT_TRUE(fit.team_index.empty());
}

TEST_F(RidgeRatingFitTest, StartingRatingsAreIgnored) {
    RidgeRatingFit fitter(config_);
    std::vector<GameResult> results = {game("A", "B", 20, 10)};
    auto cold = fitter.fit(results).ratings;
    auto warm = fitter.fit(results, {{"A", -50.0}, {"B", 50.0}}).ratings;
    EXPECT_DOUBLE_EQ(cold.at("A"), warm.at("A"));
    EXPECT_DOUBLE_EQ(cold.at("B"), warm.at("B"));
}

TEST_F(RidgeRatingFitTest, NonPositiveLambdaRejected) {
    config_.l2_lambda = 0.0;
    EXPECT_THROW(RidgeRatingFit{config_}, InvalidInputError);
}

// ============================================================================
// Elo fit
// ============================================================================

class EloRatingFitTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.k = 20.0;
        config_.hfa_points = 2.0;
        config_.iters = 2;
        config_.scale_pts = 13.0;
        config_.use_mov = true;
        config_.mov_scale_pts = 7.0;
        config_.mov_cap = 2.0;
    }

    EloFitConfig config_;
};

TEST_F(EloRatingFitTest, PushesBetterTeamUp) {
    config_.use_mov = false;
    EloRatingFit fitter(config_);
    auto r = fitter.fit({game("A", "B", 27, 10), game("A", "B", 24, 20)}).ratings;
    EXPECT_GT(r.at("A"), r.at("B"));
}

TEST_F(EloRatingFitTest, TieStaysNearStart) {
    config_.iters = 1;
    EloRatingFit fitter(config_);
    auto r = fitter.fit({game("A", "B", 21, 21)}).ratings;
    EXPECT_LT(std::abs(r.at("A")), 5.0);
    EXPECT_LT(std::abs(r.at("B")), 5.0);
    // Home was favored by hfa, so a tie moves home down
    EXPECT_LT(r.at("A"), 0.0);
}

TEST_F(EloRatingFitTest, BlowoutMovesRatingsMoreThanNarrowWin) {
    EloRatingFit fitter(config_);
    auto narrow = fitter.fit({game("A", "B", 21, 20)}).ratings;
    auto blowout = fitter.fit({game("A", "B", 42, 14)}).ratings;

    EXPECT_GT(blowout.at("A") - blowout.at("B"), narrow.at("A") - narrow.at("B"));
}

TEST_F(EloRatingFitTest, TwentyEightPointBlowoutBeatsOnePointWin) {
    EloRatingFit fitter(config_);
    auto one = fitter.fit({game("A", "B", 21, 20)}).ratings;
    auto big = fitter.fit({game("A", "B", 38, 10)}).ratings;

    EXPECT_GT(big.at("A") - big.at("B"), one.at("A") - one.at("B"));
}

TEST_F(EloRatingFitTest, MovDisabledIgnoresMargin) {
    config_.use_mov = false;
    EloRatingFit fitter(config_);
    auto one = fitter.fit({game("A", "B", 21, 20)}).ratings;
    auto big = fitter.fit({game("A", "B", 38, 10)}).ratings;

    EXPECT_DOUBLE_EQ(big.at("A"), one.at("A"));
    EXPECT_DOUBLE_EQ(big.at("B"), one.at("B"));
}

TEST_F(EloRatingFitTest, MovMultiplierIsCappedAndSublinear) {
    EloRatingFit fitter(config_);
    EXPECT_DOUBLE_EQ(fitter.mov_multiplier(0), 1.0);
    EXPECT_NEAR(fitter.mov_multiplier(7), 1.0 + std::log(2.0), 1e-12);
    EXPECT_DOUBLE_EQ(fitter.mov_multiplier(70), 2.0);
    EXPECT_DOUBLE_EQ(fitter.mov_multiplier(-70), 2.0);
    EXPECT_LT(fitter.mov_multiplier(14) - fitter.mov_multiplier(7),
              fitter.mov_multiplier(7) - fitter.mov_multiplier(0));
}

TEST_F(EloRatingFitTest, EachUpdateIsZeroSum) {
    EloRatingFit fitter(config_);
    auto r = fitter.fit({
        game("A", "B", 30, 3),
        game("C", "A", 10, 17),
        game("B", "C", 24, 24),
    }).ratings;

    EXPECT_NEAR(rating_sum(r), 0.0, 1e-9);
}

TEST_F(EloRatingFitTest, StartingRatingsAreCopiedNotMutated) {
    RatingMap start = {{"A", 5.0}, {"B", -5.0}};
    EloRatingFit fitter(config_);
    auto r = fitter.fit({game("A", "B", 10, 20)}, start).ratings;

    EXPECT_DOUBLE_EQ(start.at("A"), 5.0);
    EXPECT_DOUBLE_EQ(start.at("B"), -5.0);
    EXPECT_LT(r.at("A"), 5.0);
    // Sum is preserved from the starting point
    EXPECT_NEAR(rating_sum(r), 0.0, 1e-9);
}

TEST_F(EloRatingFitTest, UnseenTeamsStartAtZeroAndStartTeamsCarryOver) {
    RatingMap start = {{"Idle", 3.0}};
    EloRatingFit fitter(config_);
    auto r = fitter.fit({game("A", "B", 14, 7)}, start).ratings;

    EXPECT_DOUBLE_EQ(r.at("Idle"), 3.0);
    EXPECT_GT(r.at("A"), 0.0);
    EXPECT_LT(r.at("B"), 0.0);
}

TEST_F(EloRatingFitTest, MorePassesConvergeFurther) {
    config_.use_mov = false;
    std::vector<GameResult> results = {game("A", "B", 20, 10)};

    config_.iters = 1;
    auto one = EloRatingFit(config_).fit(results).ratings;
    config_.iters = 5;
    auto five = EloRatingFit(config_).fit(results).ratings;

    EXPECT_GT(five.at("A") - five.at("B"), one.at("A") - one.at("B"));
}

TEST_F(EloRatingFitTest, NonPositiveItersTreatedAsOnePass) {
    std::vector<GameResult> results = {game("A", "B", 20, 10)};
    config_.iters = 1;
    auto one = EloRatingFit(config_).fit(results).ratings;
    config_.iters = 0;
    auto zero = EloRatingFit(config_).fit(results).ratings;
    EXPECT_DOUBLE_EQ(one.at("A"), zero.at("A"));
}

TEST_F(EloRatingFitTest, EmptyInputReturnsStart) {
    EloRatingFit fitter(config_);
    EXPECT_TRUE(fitter.fit({}).ratings.empty());
}

TEST_F(EloRatingFitTest, ExpectedScoreIsLogisticInDiff) {
    EloRatingFit fitter(config_);
    EXPECT_DOUBLE_EQ(fitter.expected_home_score(0.0), 0.5);
    EXPECT_GT(fitter.expected_home_score(7.0), 0.5);
    EXPECT_NEAR(fitter.expected_home_score(7.0) + fitter.expected_home_score(-7.0), 1.0, 1e-12);
}

// ============================================================================
// Normalization
// ============================================================================

TEST(NormalizeRatingsTest, CentersAndScales) {
    RatingMap r = {{"A", 10.0}, {"B", 4.0}, {"C", 1.0}};
    auto n = normalize_ratings(r, 3.0);

    double mean = rating_sum(n) / 3.0;
    double var = 0.0;
    for (const auto& [t, v] : n) var += (v - mean) * (v - mean);
    double sd = std::sqrt(var / 3.0);

    EXPECT_NEAR(mean, 0.0, 1e-12);
    EXPECT_NEAR(sd, 3.0, 1e-12);
    EXPECT_GT(n.at("A"), n.at("B"));
    EXPECT_GT(n.at("B"), n.at("C"));
}

TEST(NormalizeRatingsTest, ZeroVarianceReturnsCentered) {
    RatingMap r = {{"A", 2.5}, {"B", 2.5}};
    auto n = normalize_ratings(r);
    EXPECT_DOUBLE_EQ(n.at("A"), 0.0);
    EXPECT_DOUBLE_EQ(n.at("B"), 0.0);
}

TEST(NormalizeRatingsTest, EmptyMap) {
    EXPECT_TRUE(normalize_ratings({}).empty());
}

// ============================================================================
// Factory
// ============================================================================

TEST(RatingEstimatorFactoryTest, BuildsConfiguredMethod) {
    RatingsConfig ratings;
    ModelConfig model;

    ratings.method = "ridge";
    EXPECT_EQ(make_rating_estimator(ratings, model)->name(), "ridge");

    ratings.method = "elo";
    EXPECT_EQ(make_rating_estimator(ratings, model)->name(), "elo");

    ratings.method = "glicko";
    EXPECT_THROW(make_rating_estimator(ratings, model), InvalidInputError);
}

TEST(RatingEstimatorFactoryTest, StrategiesAreInterchangeable) {
    RatingsConfig ratings;
    ModelConfig model;
    std::vector<GameResult> results = {game("A", "B", 31, 7), game("B", "A", 10, 24)};

    for (const char* method : {"ridge", "elo"}) {
        ratings.method = method;
        auto estimator = make_rating_estimator(ratings, model);
        auto r = estimator->fit(results).ratings;
        EXPECT_GT(r.at("A"), r.at("B")) << method;
    }
}
