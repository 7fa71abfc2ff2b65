#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"

namespace gridedge {
namespace csv_io {

/**
 * Split one CSV line on commas. Fields are trimmed; quoting is not supported.
 */
std::vector<std::string> split_line(const std::string& line);

/**
 * Header name normalization: trimmed, lower-cased, spaces -> underscores.
 * "Home Pts" -> "home_pts"
 */
std::string normalize_header(const std::string& name);

/**
 * Historical results. Required columns: home_team, away_team, home_pts,
 * away_pts. Optional: date. Rows with non-integer or negative scores are
 * skipped. Throws std::runtime_error if the file cannot be opened or a
 * required column is missing.
 */
std::vector<GameResult> load_results(const std::string& path);

/**
 * One row per game:
 * game_id,home_team,away_team,home_ml,away_ml,home_spread,
 * home_spread_price,away_spread_price,total_line,over_price,under_price
 * Malformed rows are skipped with a warning.
 */
std::vector<GameMarkets> load_odds(const std::string& path);

/**
 * team,rating. A missing file yields an empty map.
 */
RatingMap load_ratings(const std::string& path);
void save_ratings(const std::string& path, const RatingMap& ratings);

/**
 * Write tickets with a header row. Parent directories are created.
 */
void write_tickets(const std::string& path, const std::vector<Ticket>& tickets);

// Same columns as write_tickets, one row without trailing newline
std::string format_ticket_row(const Ticket& t);
extern const char* const TICKET_HEADER;

} // namespace csv_io
} // namespace gridedge
