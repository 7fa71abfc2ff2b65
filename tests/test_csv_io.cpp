#include <gtest/gtest.h>
#include "io/csv_io.hpp"
#include "utils/partitions.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace gridedge;

class CsvIoTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / ("gridedge_csv_" + std::string(info->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string write_file(const std::string& name, const std::string& body) {
        auto path = (dir_ / name).string();
        std::ofstream out(path);
        out << body;
        return path;
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ============================================================================
// Line helpers
// ============================================================================

TEST_F(CsvIoTest, SplitLineTrimsFields) {
    auto f = csv_io::split_line(" a , b,c ");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b");
    EXPECT_EQ(f[2], "c");
}

TEST_F(CsvIoTest, SplitLineKeepsEmptyTrailingField) {
    auto f = csv_io::split_line("x,,");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[1], "");
    EXPECT_EQ(f[2], "");
}

TEST_F(CsvIoTest, NormalizeHeader) {
    EXPECT_EQ(csv_io::normalize_header(" Home Pts "), "home_pts");
    EXPECT_EQ(csv_io::normalize_header("AWAY_TEAM"), "away_team");
}

// ============================================================================
// Results
// ============================================================================

TEST_F(CsvIoTest, LoadResultsWithFlexibleHeader) {
    auto path = write_file("results.csv",
        "Date,Home Team,Away Team,Home Pts,Away Pts\n"
        "2024-09-05,KC,BAL,27,20\n"
        "2024-09-08,PHI,GB,34,29\n");

    auto games = csv_io::load_results(path);
    ASSERT_EQ(games.size(), 2u);
    EXPECT_EQ(games[0].date, "2024-09-05");
    EXPECT_EQ(games[0].home_team, "KC");
    EXPECT_EQ(games[0].away_team, "BAL");
    EXPECT_EQ(games[0].margin(), 7);
    EXPECT_EQ(games[1].home_points, 34);
}

TEST_F(CsvIoTest, LoadResultsSkipsBadRows) {
    auto path = write_file("results.csv",
        "home_team,away_team,home_pts,away_pts\n"
        "A,B,21,14\n"
        "A,B,abc,14\n"
        "A,B,-3,10\n"
        ",B,10,3\n"
        "\n"
        "C,D,17,17\n");

    auto games = csv_io::load_results(path);
    ASSERT_EQ(games.size(), 2u);
    EXPECT_EQ(games[0].home_team, "A");
    EXPECT_EQ(games[1].home_team, "C");
    EXPECT_EQ(games[1].margin(), 0);
}

TEST_F(CsvIoTest, LoadResultsMissingColumnThrows) {
    auto path = write_file("results.csv", "home_team,away_team,home_pts\nA,B,3\n");
    EXPECT_THROW(csv_io::load_results(path), std::runtime_error);
}

TEST_F(CsvIoTest, LoadResultsMissingFileThrows) {
    EXPECT_THROW(csv_io::load_results((dir_ / "none.csv").string()), std::runtime_error);
}

// ============================================================================
// Odds
// ============================================================================

TEST_F(CsvIoTest, LoadOddsBuildsBothSides) {
    auto path = write_file("odds.csv",
        "game_id,home_team,away_team,home_ml,away_ml,home_spread,"
        "home_spread_price,away_spread_price,total_line,over_price,under_price\n"
        "W1-001,KC,BAL,-120,+110,-2.5,-110,-105,48.5,-110,-110\n"
        "W1-002,PHI,GB,oops,110,-1.5,-110,-110,45.5,-110,-110\n");

    auto games = csv_io::load_odds(path);
    ASSERT_EQ(games.size(), 1u);

    const auto& g = games[0];
    EXPECT_EQ(g.game_id, "W1-001");
    EXPECT_EQ(g.home_ml.american_price, -120);
    EXPECT_EQ(g.away_ml.american_price, 110);
    EXPECT_FALSE(g.home_ml.line.has_value());

    ASSERT_TRUE(g.home_spread.line && g.away_spread.line);
    EXPECT_DOUBLE_EQ(*g.home_spread.line, -2.5);
    EXPECT_DOUBLE_EQ(*g.away_spread.line, 2.5);
    EXPECT_EQ(g.away_spread.american_price, -105);

    ASSERT_TRUE(g.over.line.has_value());
    EXPECT_DOUBLE_EQ(*g.over.line, 48.5);
    EXPECT_EQ(g.over.side, "OVER");
    EXPECT_EQ(g.under.side, "UNDER");
}

// ============================================================================
// Ratings
// ============================================================================

TEST_F(CsvIoTest, RatingsRoundTrip) {
    RatingMap ratings{{"KC", 4.25}, {"BAL", -1.5}, {"GB", 0.0}};
    auto path = (dir_ / "out" / "ratings.csv").string();
    csv_io::save_ratings(path, ratings);

    auto loaded = csv_io::load_ratings(path);
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_NEAR(loaded["KC"], 4.25, 1e-6);
    EXPECT_NEAR(loaded["BAL"], -1.5, 1e-6);
    EXPECT_NEAR(loaded["GB"], 0.0, 1e-6);
}

TEST_F(CsvIoTest, MissingRatingsFileIsEmpty) {
    EXPECT_TRUE(csv_io::load_ratings((dir_ / "absent.csv").string()).empty());
}

// ============================================================================
// Tickets
// ============================================================================

TEST_F(CsvIoTest, TicketRowFormatting) {
    Ticket t;
    t.game_id = "W1-001";
    t.market = MarketKind::ATS;
    t.side = "HOME";
    t.american_price = -110;
    t.decimal_price = 1.909091;
    t.line = -2.5;
    t.fair_probability = 0.5;
    t.model_probability = 0.55;
    t.edge = 0.05;
    t.ev_per_dollar = 0.05;
    t.kelly_stake = 18.15;

    EXPECT_EQ(csv_io::format_ticket_row(t),
              "W1-001,ATS,HOME,-110,1.9091,-2.5,0.5000,0.5500,+0.0500,+0.0500,18.15,,,");

    ProbabilityEstimate est;
    est.point_estimate = 0.5512;
    est.confidence_lo = 0.5414;
    est.confidence_hi = 0.5610;
    t.simulated = est;
    t.market = MarketKind::OU;
    t.side = "OVER";
    t.line = 48.5;
    EXPECT_EQ(csv_io::format_ticket_row(t),
              "W1-001,OU,OVER,-110,1.9091,48.5,0.5000,0.5500,+0.0500,+0.0500,18.15,0.5512,0.5414,0.5610");
}

TEST_F(CsvIoTest, WriteTicketsHasHeader) {
    Ticket t;
    t.game_id = "W1-001";
    t.side = "HOME";
    t.american_price = 150;
    t.decimal_price = 2.5;

    auto path = (dir_ / "nested" / "tickets.csv").string();
    csv_io::write_tickets(path, {t});

    auto body = read_file(path);
    EXPECT_EQ(body.rfind(csv_io::TICKET_HEADER, 0), 0u);
    EXPECT_NE(body.find("W1-001,ML,HOME,+150,2.5000,,"), std::string::npos);
}

// ============================================================================
// Partitions
// ============================================================================

TEST_F(CsvIoTest, PartitionPathLayout) {
    EXPECT_EQ(partitions::partition_path("/lake", "reference", "NFL", 2024),
              "/lake/reference/league=NFL/season=2024");
    EXPECT_EQ(partitions::partition_path("/lake", "picks", "CFB", 2023, 7),
              "/lake/picks/league=CFB/season=2023/week=7");
}

TEST_F(CsvIoTest, EnsureDirCreatesParents) {
    auto path = (dir_ / "a" / "b" / "c").string();
    partitions::ensure_dir(path);
    EXPECT_TRUE(std::filesystem::is_directory(path));
}
