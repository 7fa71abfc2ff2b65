#include "io/csv_io.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gridedge {
namespace csv_io {

const char* const TICKET_HEADER =
    "game_id,market,side_or_bet,odds_am,odds_dec,line,fair_prob,model_prob,"
    "edge,ev_per_dollar,kelly_stake,mc_prob,mc_ci_lo,mc_ci_hi";

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Column name -> position, from a normalized header row
std::map<std::string, size_t> header_index(const std::string& header_line) {
    std::map<std::string, size_t> idx;
    auto fields = split_line(header_line);
    for (size_t i = 0; i < fields.size(); ++i) {
        idx[normalize_header(fields[i])] = i;
    }
    return idx;
}

const std::string& field(const std::vector<std::string>& row,
                         const std::map<std::string, size_t>& idx,
                         const std::string& name) {
    static const std::string empty;
    auto it = idx.find(name);
    if (it == idx.end() || it->second >= row.size()) return empty;
    return row[it->second];
}

// Whole-string integer parse; false on any trailing garbage
bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    size_t pos = 0;
    try {
        out = std::stoi(s, &pos);
    } catch (const std::exception&) {
        return false;
    }
    return pos == s.size();
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    size_t pos = 0;
    try {
        out = std::stod(s, &pos);
    } catch (const std::exception&) {
        return false;
    }
    return pos == s.size();
}

void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

} // namespace

std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(trim(item));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::string normalize_header(const std::string& name) {
    std::string s = trim(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(s.begin(), s.end(), ' ', '_');
    return s;
}

std::vector<GameResult> load_results(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open results file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        return {};
    }
    auto idx = header_index(line);
    for (const char* col : {"home_team", "away_team", "home_pts", "away_pts"}) {
        if (!idx.count(col)) {
            throw std::runtime_error(fmt::format("Results file {} missing column '{}'", path, col));
        }
    }

    std::vector<GameResult> results;
    int skipped = 0;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        auto row = split_line(line);

        GameResult g;
        g.date = field(row, idx, "date");
        g.home_team = field(row, idx, "home_team");
        g.away_team = field(row, idx, "away_team");
        if (!parse_int(field(row, idx, "home_pts"), g.home_points)
            || !parse_int(field(row, idx, "away_pts"), g.away_points)
            || g.home_points < 0 || g.away_points < 0
            || g.home_team.empty() || g.away_team.empty()) {
            spdlog::debug("Skipping results row: {}", line);
            ++skipped;
            continue;
        }
        results.push_back(std::move(g));
    }

    spdlog::info("Loaded {} results from {} ({} rows skipped)", results.size(), path, skipped);
    return results;
}

std::vector<GameMarkets> load_odds(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open odds file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        return {};
    }
    auto idx = header_index(line);

    std::vector<GameMarkets> games;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        auto row = split_line(line);

        GameMarkets g;
        g.game_id = field(row, idx, "game_id");
        g.home_team = field(row, idx, "home_team");
        g.away_team = field(row, idx, "away_team");

        int home_ml = 0, away_ml = 0, sp_home = 0, sp_away = 0, over = 0, under = 0;
        double spread = 0.0, total = 0.0;
        bool ok = !g.game_id.empty()
            && parse_int(field(row, idx, "home_ml"), home_ml)
            && parse_int(field(row, idx, "away_ml"), away_ml)
            && parse_double(field(row, idx, "home_spread"), spread)
            && parse_int(field(row, idx, "home_spread_price"), sp_home)
            && parse_int(field(row, idx, "away_spread_price"), sp_away)
            && parse_double(field(row, idx, "total_line"), total)
            && parse_int(field(row, idx, "over_price"), over)
            && parse_int(field(row, idx, "under_price"), under);
        if (!ok) {
            spdlog::warn("Skipping malformed odds row: {}", line);
            continue;
        }

        g.home_ml = {g.game_id, "HOME", home_ml, std::nullopt};
        g.away_ml = {g.game_id, "AWAY", away_ml, std::nullopt};
        g.home_spread = {g.game_id, "HOME", sp_home, spread};
        g.away_spread = {g.game_id, "AWAY", sp_away, -spread};
        g.over = {g.game_id, "OVER", over, total};
        g.under = {g.game_id, "UNDER", under, total};
        games.push_back(std::move(g));
    }

    spdlog::info("Loaded {} games of odds from {}", games.size(), path);
    return games;
}

RatingMap load_ratings(const std::string& path) {
    RatingMap ratings;
    std::ifstream file(path);
    if (!file.is_open()) {
        return ratings;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        if (normalize_header(line).rfind("team,", 0) == 0) continue;

        auto row = split_line(line);
        double value = 0.0;
        if (row.size() < 2 || row[0].empty() || !parse_double(row[1], value)) {
            spdlog::warn("Skipping ratings row: {}", line);
            continue;
        }
        ratings[row[0]] = value;
    }
    return ratings;
}

void save_ratings(const std::string& path, const RatingMap& ratings) {
    ensure_parent_dir(path);
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create ratings file: " + path);
    }

    file << "team,rating\n";
    for (const auto& [team, rating] : ratings) {
        file << team << "," << fmt::format("{:.6f}", rating) << "\n";
    }
    spdlog::info("Saved {} ratings to {}", ratings.size(), path);
}

std::string format_ticket_row(const Ticket& t) {
    std::string line;
    if (t.line) {
        line = t.market == MarketKind::OU ? fmt::format("{:.1f}", *t.line)
                                          : fmt::format("{:+.1f}", *t.line);
    }

    std::string mc_prob, mc_lo, mc_hi;
    if (t.simulated) {
        mc_prob = fmt::format("{:.4f}", t.simulated->point_estimate);
        if (t.simulated->confidence_lo) mc_lo = fmt::format("{:.4f}", *t.simulated->confidence_lo);
        if (t.simulated->confidence_hi) mc_hi = fmt::format("{:.4f}", *t.simulated->confidence_hi);
    }

    return fmt::format("{},{},{},{:+d},{:.4f},{},{:.4f},{:.4f},{:+.4f},{:+.4f},{:.2f},{},{},{}",
                       t.game_id, market_kind_to_string(t.market), t.side,
                       t.american_price, t.decimal_price, line,
                       t.fair_probability, t.model_probability,
                       t.edge, t.ev_per_dollar, t.kelly_stake,
                       mc_prob, mc_lo, mc_hi);
}

void write_tickets(const std::string& path, const std::vector<Ticket>& tickets) {
    ensure_parent_dir(path);
    std::ofstream csv(path);
    if (!csv.is_open()) {
        throw std::runtime_error("Failed to create tickets file: " + path);
    }

    csv << TICKET_HEADER << "\n";
    for (const auto& t : tickets) {
        csv << format_ticket_row(t) << "\n";
    }

    spdlog::info("Saved {} tickets to {}", tickets.size(), path);
}

} // namespace csv_io
} // namespace gridedge
