#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace gridedge {

struct ModelConfig {
    double hfa_points{2.0};                  // Home-field advantage in points
    double sigma_diff{13.0};                 // Stdev of point differential
    double sigma_total{10.0};                // Stdev of combined score
    double league_total_mean{45.0};          // Mean combined score for totals
};

struct RatingsConfig {
    std::string method{"ridge"};             // ridge, elo

    // Ridge
    double l2_lambda{4.0};
    bool enforce_sum_zero{true};

    // Elo
    double elo_k{20.0};
    int elo_iters{2};
    double elo_scale_pts{13.0};
    bool mov_enabled{true};
    double mov_scale_pts{7.0};
    double mov_cap{2.0};

    // Post-fit rescaling
    bool normalize{false};
    double ratings_target_std{3.0};
};

struct BettingConfig {
    double bankroll{1000.0};
    double kelly_fraction{0.33};             // 1/3 Kelly
    double min_edge_pct{0.0};                // Minimum model - fair probability
    double min_kelly_stake{0.0};             // Minimum stake in bankroll units
};

struct SimulationConfig {
    int mc_n{0};                             // 0 disables Monte Carlo annotation
    std::optional<uint64_t> mc_seed;         // Unset = non-deterministic
    double ci_z{1.96};                       // ~95% two-sided
};

struct PathsConfig {
    std::string datalake{"./data"};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // trace, debug, info, warn, error, critical
    bool log_to_console{true};
    bool log_to_file{false};
    int max_log_file_size_mb{10};
    int max_log_files{3};
};

struct Config {
    ModelConfig model;
    RatingsConfig ratings;
    BettingConfig betting;
    SimulationConfig simulation;
    PathsConfig paths;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace gridedge
