#pragma once

#include <vector>
#include <optional>
#include <cstdint>
#include "common/types.hpp"
#include "config/config.hpp"
#include "model/probability_model.hpp"

namespace gridedge {

/**
 * Turns posted prices into betting tickets.
 *
 * For every game three legs are priced: ML HOME, ATS HOME and OU OVER.
 * Each leg is de-vigged against its opposite side to get the fair
 * probability, compared with the model probability, and sized with
 * fractional Kelly. Legs passing `edge >= min_edge_pct` and
 * `stake >= min_kelly_stake` become tickets.
 *
 * A leg with an invalid price, a missing spread or total line, or a model
 * probability outside (0,1) is logged and skipped; the rest of the slate is
 * still evaluated.
 */
class TicketScanner {
public:
    TicketScanner(
        ProbabilityModel model,
        const BettingConfig& betting,
        const SimulationConfig& simulation,
        double league_total_mean
    );

    // Evaluate a slate. Output is sorted by (game_id, market kind).
    std::vector<Ticket> scan(const std::vector<GameMarkets>& games);

    // Evaluate one game; `ordinal` is its position in the slate
    std::vector<Ticket> evaluate_game(const GameMarkets& game, size_t ordinal);

    bool passes(double edge, double stake) const;

    const ProbabilityModel& model() const { return model_; }

    // Stats
    int64_t legs_evaluated() const { return legs_evaluated_; }
    int64_t legs_skipped() const { return legs_skipped_; }
    int64_t tickets_generated() const { return tickets_generated_; }

private:
    ProbabilityModel model_;
    BettingConfig betting_;
    SimulationConfig simulation_;
    double league_total_mean_;

    int64_t legs_evaluated_{0};
    int64_t legs_skipped_{0};
    int64_t tickets_generated_{0};

    struct LegInput {
        MarketKind kind;
        const MarketQuote* leg;
        const MarketQuote* opposite;
        double model_probability;
        double sim_mean;
        double sim_sigma;
        double sim_threshold;
    };

    // Throws InvalidInputError when a spread or total line is missing
    LegInput make_leg(const GameMarkets& game, MarketKind kind) const;
    static double require_line(const GameMarkets& game, const MarketQuote& quote, const char* what);

    std::optional<Ticket> evaluate_leg(const GameMarkets& game, const LegInput& in, size_t ordinal);
    std::optional<uint64_t> leg_seed(size_t ordinal, MarketKind kind) const;
};

/**
 * Best tickets first: edge descending, then stake descending.
 * Returns at most top_n entries.
 */
std::vector<Ticket> rank_tickets(std::vector<Ticket> tickets, size_t top_n);

} // namespace gridedge
