#include <iostream>
#include <filesystem>
#include <algorithm>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "io/csv_io.hpp"
#include "markets/ticket_scanner.hpp"
#include "model/probability_model.hpp"
#include "ratings/rating_estimator.hpp"
#include "utils/partitions.hpp"

using namespace gridedge;

// Console sink writes to stderr; stdout carries ticket rows.
void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("%H:%M:%S [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (std::filesystem::path(config.log_dir) / "gridedge.log").string(),
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("gridedge", sinks.begin(), sinks.end());
    // Level string is checked by Config::validate
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

Config load_config_or_default(const std::string& path) {
    if (path.empty()) {
        return Config{};
    }
    return Config::load(path);
}

int run_fit(const Config& config, const std::string& results_path,
            const std::string& start_path, const std::string& out_path) {
    auto results = csv_io::load_results(results_path);

    RatingMap start;
    if (!start_path.empty()) {
        start = csv_io::load_ratings(start_path);
        spdlog::info("Starting from {} ratings in {}", start.size(), start_path);
    }

    auto estimator = make_rating_estimator(config.ratings, config.model);
    auto fit = estimator->fit(results, start);
    RatingMap ratings = fit.ratings;

    if (config.ratings.normalize) {
        ratings = normalize_ratings(ratings, config.ratings.ratings_target_std);
    }

    spdlog::info("Fitted {} team ratings with {} from {} games",
                 ratings.size(), estimator->name(), results.size());

    std::vector<std::pair<std::string, double>> table(ratings.begin(), ratings.end());
    std::sort(table.begin(), table.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    for (const auto& [team, rating] : table) {
        std::cout << fmt::format("{:<24} {:+8.3f}", team, rating) << "\n";
    }

    if (!out_path.empty()) {
        csv_io::save_ratings(out_path, ratings);
    }
    return 0;
}

int run_daily(const Config& config, int season, int week, const std::string& league,
              std::string odds_path, std::string ratings_path) {
    const auto& root = config.paths.datalake;
    auto bronze = partitions::partition_path(root, "bronze", league, season, week);
    auto silver = partitions::partition_path(root, "silver", league, season, week);
    auto gold = partitions::partition_path(root, "gold", league, season, week);
    for (const auto& dir : {bronze, silver, gold}) {
        partitions::ensure_dir(dir);
    }

    spdlog::info("Daily run | league={} season={} week={}", league, season, week);
    spdlog::info("bankroll={:.2f} kelly_fraction={:.2f} min_edge={:.3f} min_stake={:.2f}",
                 config.betting.bankroll, config.betting.kelly_fraction,
                 config.betting.min_edge_pct, config.betting.min_kelly_stake);

    if (ratings_path.empty()) {
        ratings_path = (std::filesystem::path(silver) / "teams" / "ratings.csv").string();
    }
    auto ratings = csv_io::load_ratings(ratings_path);
    spdlog::info("Loaded {} team ratings from {}", ratings.size(), ratings_path);

    if (odds_path.empty()) {
        odds_path = (std::filesystem::path(bronze) / "odds.csv").string();
    }
    auto games = csv_io::load_odds(odds_path);

    ProbabilityModel model(ratings, config.model.hfa_points,
                           config.model.sigma_diff, config.model.sigma_total);
    TicketScanner scanner(model, config.betting, config.simulation, config.model.league_total_mean);
    auto tickets = scanner.scan(games);

    std::cout << csv_io::TICKET_HEADER << "\n";
    for (const auto& t : tickets) {
        std::cout << csv_io::format_ticket_row(t) << "\n";
    }

    csv_io::write_tickets((std::filesystem::path(gold) / "tickets.csv").string(), tickets);

    for (const auto& t : rank_tickets(tickets, 3)) {
        spdlog::info("Top pick: {} {} {} {:+d} edge={:+.4f} stake={:.2f}",
                     t.game_id, market_kind_to_string(t.market), t.side,
                     t.american_price, t.edge, t.kelly_stake);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"GridEdge - team ratings and betting edge calculator"};
    app.require_subcommand(1);

    std::string config_path;
    app.add_option("-c,--config", config_path, "Path to JSON configuration file")
        ->check(CLI::ExistingFile);

    // fit
    auto* fit_cmd = app.add_subcommand("fit", "Fit team ratings from historical results");
    std::string results_path;
    std::string start_path;
    std::string out_path;
    std::string method;
    fit_cmd->add_option("--results", results_path, "Results CSV")
        ->required()
        ->check(CLI::ExistingFile);
    fit_cmd->add_option("--start", start_path, "Starting ratings CSV (team,rating)");
    fit_cmd->add_option("--out", out_path, "Output ratings CSV");
    fit_cmd->add_option("--method", method, "Rating method")
        ->check(CLI::IsMember({"ridge", "elo"}));

    // daily
    auto* daily_cmd = app.add_subcommand("daily", "Price the slate and emit tickets");
    int season = 0;
    int week = 0;
    std::string league = "NFL";
    std::string odds_path;
    std::string ratings_path;
    daily_cmd->add_option("--season", season, "Season year, e.g. 2025")->required();
    daily_cmd->add_option("--week", week, "Week number")->required();
    daily_cmd->add_option("--league", league, "League")
        ->check(CLI::IsMember({"NFL", "CFB"}));
    daily_cmd->add_option("--odds", odds_path, "Odds CSV (default: bronze partition)");
    daily_cmd->add_option("--ratings", ratings_path, "Ratings CSV (default: silver partition)");

    CLI11_PARSE(app, argc, argv);

    Config config;
    try {
        config = load_config_or_default(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    if (!method.empty()) {
        config.ratings.method = method;
    }

    setup_logging(config.logging);

    try {
        if (*fit_cmd) {
            return run_fit(config, results_path, start_path, out_path);
        }
        if (*daily_cmd) {
            return run_daily(config, season, week, league, odds_path, ratings_path);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
