#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>

namespace gridedge {

// Team strength on a points scale. Unseen teams rate 0.0.
using RatingMap = std::map<std::string, double>;
using TeamIndex = std::map<std::string, int>;

// Signed US sportsbook price, e.g. +150 or -120. Never 0.
using AmericanOdds = int;

// Final score of one historical game
struct GameResult {
    std::string date;
    std::string home_team;
    std::string away_team;
    int home_points{0};
    int away_points{0};

    int margin() const { return home_points - away_points; }
};

// Market kinds
enum class MarketKind {
    ML,   // Moneyline
    ATS,  // Against the spread
    OU    // Over/under (totals)
};

inline std::string market_kind_to_string(MarketKind k) {
    switch (k) {
        case MarketKind::ML: return "ML";
        case MarketKind::ATS: return "ATS";
        case MarketKind::OU: return "OU";
    }
    return "UNKNOWN";
}

// One leg of a two-way market
struct MarketQuote {
    std::string game_id;
    std::string side;                 // "HOME", "AWAY", "OVER", "UNDER"
    AmericanOdds american_price{0};
    std::optional<double> line;       // Spread or total; none for moneyline
};

// All two-way markets posted for one game
struct GameMarkets {
    std::string game_id;
    std::string home_team;
    std::string away_team;

    MarketQuote home_ml;
    MarketQuote away_ml;

    MarketQuote home_spread;          // line = home spread, e.g. -2.5
    MarketQuote away_spread;

    MarketQuote over;                 // line = total, e.g. 48.5
    MarketQuote under;
};

// Probability with an optional Monte Carlo confidence interval
struct ProbabilityEstimate {
    double point_estimate{0.5};
    std::optional<double> confidence_lo;
    std::optional<double> confidence_hi;
};

// One recommended market leg
struct Ticket {
    std::string game_id;
    MarketKind market{MarketKind::ML};
    std::string side;
    AmericanOdds american_price{0};
    double decimal_price{0.0};
    std::optional<double> line;
    double fair_probability{0.0};
    double model_probability{0.0};
    double edge{0.0};                 // model_probability - fair_probability
    double ev_per_dollar{0.0};
    double kelly_stake{0.0};
    std::optional<ProbabilityEstimate> simulated;
};

} // namespace gridedge
