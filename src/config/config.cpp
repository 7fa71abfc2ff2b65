#include "config/config.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace gridedge {

void to_json(nlohmann::json& j, const ModelConfig& c) {
    j = nlohmann::json{
        {"hfa_points", c.hfa_points},
        {"sigma_diff", c.sigma_diff},
        {"sigma_total", c.sigma_total},
        {"league_total_mean", c.league_total_mean}
    };
}

void from_json(const nlohmann::json& j, ModelConfig& c) {
    if (j.contains("hfa_points")) j.at("hfa_points").get_to(c.hfa_points);
    if (j.contains("sigma_diff")) j.at("sigma_diff").get_to(c.sigma_diff);
    if (j.contains("sigma_total")) j.at("sigma_total").get_to(c.sigma_total);
    if (j.contains("league_total_mean")) j.at("league_total_mean").get_to(c.league_total_mean);
}

void to_json(nlohmann::json& j, const RatingsConfig& c) {
    j = nlohmann::json{
        {"method", c.method},
        {"l2_lambda", c.l2_lambda},
        {"enforce_sum_zero", c.enforce_sum_zero},
        {"elo_k", c.elo_k},
        {"elo_iters", c.elo_iters},
        {"elo_scale_pts", c.elo_scale_pts},
        {"mov_enabled", c.mov_enabled},
        {"mov_scale_pts", c.mov_scale_pts},
        {"mov_cap", c.mov_cap},
        {"normalize", c.normalize},
        {"ratings_target_std", c.ratings_target_std}
    };
}

void from_json(const nlohmann::json& j, RatingsConfig& c) {
    if (j.contains("method")) j.at("method").get_to(c.method);
    if (j.contains("l2_lambda")) j.at("l2_lambda").get_to(c.l2_lambda);
    if (j.contains("enforce_sum_zero")) j.at("enforce_sum_zero").get_to(c.enforce_sum_zero);
    if (j.contains("elo_k")) j.at("elo_k").get_to(c.elo_k);
    if (j.contains("elo_iters")) j.at("elo_iters").get_to(c.elo_iters);
    if (j.contains("elo_scale_pts")) j.at("elo_scale_pts").get_to(c.elo_scale_pts);
    if (j.contains("mov_enabled")) j.at("mov_enabled").get_to(c.mov_enabled);
    if (j.contains("mov_scale_pts")) j.at("mov_scale_pts").get_to(c.mov_scale_pts);
    if (j.contains("mov_cap")) j.at("mov_cap").get_to(c.mov_cap);
    if (j.contains("normalize")) j.at("normalize").get_to(c.normalize);
    if (j.contains("ratings_target_std")) j.at("ratings_target_std").get_to(c.ratings_target_std);
}

void to_json(nlohmann::json& j, const BettingConfig& c) {
    j = nlohmann::json{
        {"bankroll", c.bankroll},
        {"kelly_fraction", c.kelly_fraction},
        {"min_edge_pct", c.min_edge_pct},
        {"min_kelly_stake", c.min_kelly_stake}
    };
}

void from_json(const nlohmann::json& j, BettingConfig& c) {
    if (j.contains("bankroll")) j.at("bankroll").get_to(c.bankroll);
    if (j.contains("kelly_fraction")) j.at("kelly_fraction").get_to(c.kelly_fraction);
    if (j.contains("min_edge_pct")) j.at("min_edge_pct").get_to(c.min_edge_pct);
    if (j.contains("min_kelly_stake")) j.at("min_kelly_stake").get_to(c.min_kelly_stake);
}

void to_json(nlohmann::json& j, const SimulationConfig& c) {
    j = nlohmann::json{
        {"mc_n", c.mc_n},
        {"ci_z", c.ci_z}
    };
    if (c.mc_seed) {
        j["mc_seed"] = *c.mc_seed;
    } else {
        j["mc_seed"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, SimulationConfig& c) {
    if (j.contains("mc_n")) j.at("mc_n").get_to(c.mc_n);
    if (j.contains("ci_z")) j.at("ci_z").get_to(c.ci_z);
    if (j.contains("mc_seed")) {
        if (j.at("mc_seed").is_null()) {
            c.mc_seed.reset();
        } else {
            c.mc_seed = j.at("mc_seed").get<uint64_t>();
        }
    }
}

void to_json(nlohmann::json& j, const PathsConfig& c) {
    j = nlohmann::json{
        {"datalake", c.datalake}
    };
}

void from_json(const nlohmann::json& j, PathsConfig& c) {
    if (j.contains("datalake")) j.at("datalake").get_to(c.datalake);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"model", c.model},
        {"ratings", c.ratings},
        {"betting", c.betting},
        {"simulation", c.simulation},
        {"paths", c.paths},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("model")) j.at("model").get_to(c.model);
    if (j.contains("ratings")) j.at("ratings").get_to(c.ratings);
    if (j.contains("betting")) j.at("betting").get_to(c.betting);
    if (j.contains("simulation")) j.at("simulation").get_to(c.simulation);
    if (j.contains("paths")) j.at("paths").get_to(c.paths);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        nlohmann::json j;
        file >> j;
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    bool ok = true;

    if (model.sigma_diff <= 0) {
        spdlog::error("model.sigma_diff must be positive, got {}", model.sigma_diff);
        ok = false;
    }

    if (model.sigma_total <= 0) {
        spdlog::error("model.sigma_total must be positive, got {}", model.sigma_total);
        ok = false;
    }

    if (ratings.method != "ridge" && ratings.method != "elo") {
        spdlog::error("ratings.method must be 'ridge' or 'elo', got '{}'", ratings.method);
        ok = false;
    }

    if (ratings.l2_lambda <= 0) {
        spdlog::error("ratings.l2_lambda must be positive, got {}", ratings.l2_lambda);
        ok = false;
    }

    if (ratings.elo_k <= 0 || ratings.elo_scale_pts <= 0) {
        spdlog::error("ratings.elo_k and ratings.elo_scale_pts must be positive");
        ok = false;
    }

    if (ratings.elo_iters < 1) {
        spdlog::error("ratings.elo_iters must be >= 1, got {}", ratings.elo_iters);
        ok = false;
    }

    if (ratings.mov_scale_pts <= 0) {
        spdlog::error("ratings.mov_scale_pts must be positive, got {}", ratings.mov_scale_pts);
        ok = false;
    }

    if (ratings.mov_cap < 1.0) {
        spdlog::error("ratings.mov_cap must be >= 1, got {}", ratings.mov_cap);
        ok = false;
    }

    if (ratings.ratings_target_std <= 0) {
        spdlog::error("ratings.ratings_target_std must be positive, got {}", ratings.ratings_target_std);
        ok = false;
    }

    if (betting.kelly_fraction <= 0 || betting.kelly_fraction > 1.0) {
        spdlog::error("betting.kelly_fraction must be in (0,1], got {}", betting.kelly_fraction);
        ok = false;
    }

    if (betting.bankroll < 0) {
        spdlog::error("betting.bankroll must be non-negative, got {}", betting.bankroll);
        ok = false;
    }

    if (betting.kelly_fraction > 0.5) {
        spdlog::warn("betting.kelly_fraction is > 0.5 Kelly, this is aggressive");
    }

    if (simulation.mc_n < 0) {
        spdlog::error("simulation.mc_n must be non-negative, got {}", simulation.mc_n);
        ok = false;
    }

    if (simulation.ci_z <= 0) {
        spdlog::error("simulation.ci_z must be positive, got {}", simulation.ci_z);
        ok = false;
    }

    if (spdlog::level::from_str(logging.log_level) == spdlog::level::off) {
        spdlog::error("logging.log_level must be trace, debug, info, warn, error or critical, got '{}'",
                      logging.log_level);
        ok = false;
    }

    if (logging.max_log_file_size_mb <= 0 || logging.max_log_files <= 0) {
        spdlog::error("logging.max_log_file_size_mb and logging.max_log_files must be positive");
        ok = false;
    }

    return ok;
}

} // namespace gridedge
