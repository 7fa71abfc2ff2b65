#include "markets/ticket_scanner.hpp"
#include "markets/price_converter.hpp"
#include "markets/edge_calculator.hpp"
#include "model/confidence.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <tuple>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gridedge {

TicketScanner::TicketScanner(
    ProbabilityModel model,
    const BettingConfig& betting,
    const SimulationConfig& simulation,
    double league_total_mean
)
    : model_(std::move(model))
    , betting_(betting)
    , simulation_(simulation)
    , league_total_mean_(league_total_mean)
{
    spdlog::info("TicketScanner initialized: bankroll={:.2f}, kelly_fraction={:.2f}, "
                 "min_edge={:.3f}, min_stake={:.2f}, mc_n={}",
                 betting_.bankroll, betting_.kelly_fraction,
                 betting_.min_edge_pct, betting_.min_kelly_stake, simulation_.mc_n);
}

bool TicketScanner::passes(double edge, double stake) const {
    return edge >= betting_.min_edge_pct && stake >= betting_.min_kelly_stake;
}

std::vector<Ticket> TicketScanner::scan(const std::vector<GameMarkets>& games) {
    std::vector<Ticket> tickets;

    for (size_t i = 0; i < games.size(); ++i) {
        auto game_tickets = evaluate_game(games[i], i);
        tickets.insert(tickets.end(), game_tickets.begin(), game_tickets.end());
    }

    std::stable_sort(tickets.begin(), tickets.end(), [](const Ticket& a, const Ticket& b) {
        return std::make_tuple(a.game_id, static_cast<int>(a.market))
             < std::make_tuple(b.game_id, static_cast<int>(b.market));
    });

    spdlog::info("Scanned {} games: {} legs evaluated, {} skipped, {} tickets",
                 games.size(), legs_evaluated_, legs_skipped_, tickets.size());
    return tickets;
}

std::vector<Ticket> TicketScanner::evaluate_game(const GameMarkets& game, size_t ordinal) {
    std::vector<Ticket> tickets;

    for (MarketKind kind : {MarketKind::ML, MarketKind::ATS, MarketKind::OU}) {
        ++legs_evaluated_;
        try {
            auto ticket = evaluate_leg(game, make_leg(game, kind), ordinal);
            if (ticket) {
                tickets.push_back(std::move(*ticket));
                ++tickets_generated_;
            }
        } catch (const InvalidInputError& e) {
            ++legs_skipped_;
            spdlog::warn("Skipping {} {} leg: {}",
                         game.game_id, market_kind_to_string(kind), e.what());
        }
    }

    return tickets;
}

TicketScanner::LegInput TicketScanner::make_leg(const GameMarkets& game, MarketKind kind) const {
    double mu = model_.mean_diff(game.home_team, game.away_team);

    switch (kind) {
        case MarketKind::ML:
            return {kind, &game.home_ml, &game.away_ml,
                    model_.win_probability(game.home_team, game.away_team),
                    mu, model_.sigma_diff(), 0.0};

        case MarketKind::ATS: {
            double spread = require_line(game, game.home_spread, "spread");
            return {kind, &game.home_spread, &game.away_spread,
                    model_.cover_probability(game.home_team, game.away_team, spread),
                    mu, model_.sigma_diff(), spread};
        }

        case MarketKind::OU: {
            double total = require_line(game, game.over, "total");
            return {kind, &game.over, &game.under,
                    model_.over_probability(total, league_total_mean_),
                    league_total_mean_, model_.sigma_total(), total};
        }
    }
    throw InvalidInputError("Unknown market kind");
}

double TicketScanner::require_line(const GameMarkets& game, const MarketQuote& quote, const char* what) {
    if (!quote.line) {
        throw InvalidInputError(fmt::format("game {} has no {} line", game.game_id, what));
    }
    return *quote.line;
}

std::optional<Ticket> TicketScanner::evaluate_leg(
    const GameMarkets& game,
    const LegInput& in,
    size_t ordinal
) {
    double p_leg = implied_probability(in.leg->american_price);
    double p_opp = implied_probability(in.opposite->american_price);
    double fair = remove_vig_two_way(p_leg, p_opp).first;

    double decimal = american_to_decimal(in.leg->american_price);
    auto er = ev_and_edge(in.model_probability, fair, decimal);
    double stake = kelly_fractional(in.model_probability, decimal,
                                    betting_.bankroll, betting_.kelly_fraction);

    spdlog::debug("{} {} {}: fair={:.4f} model={:.4f} edge={:+.4f} ev={:+.4f} stake={:.2f}",
                  game.game_id, market_kind_to_string(in.kind), in.leg->side,
                  fair, in.model_probability, er.edge, er.ev_per_dollar, stake);

    if (!passes(er.edge, stake)) {
        return std::nullopt;
    }

    Ticket t;
    t.game_id = game.game_id;
    t.market = in.kind;
    t.side = in.leg->side;
    t.american_price = in.leg->american_price;
    t.decimal_price = decimal;
    t.line = in.leg->line;
    t.fair_probability = fair;
    t.model_probability = in.model_probability;
    t.edge = er.edge;
    t.ev_per_dollar = er.ev_per_dollar;
    t.kelly_stake = stake;

    if (simulation_.mc_n > 0) {
        RandomSource rng(leg_seed(ordinal, in.kind));
        ProbabilityEstimate est;
        est.point_estimate = simulate_prob_over(in.sim_mean, in.sim_sigma, in.sim_threshold,
                                                simulation_.mc_n, rng);
        auto ci = mc_ci_normal(est.point_estimate, simulation_.mc_n, simulation_.ci_z);
        est.confidence_lo = ci.first;
        est.confidence_hi = ci.second;
        t.simulated = est;
    }

    return t;
}

std::optional<uint64_t> TicketScanner::leg_seed(size_t ordinal, MarketKind kind) const {
    if (!simulation_.mc_seed) {
        return std::nullopt;
    }
    // One independent, reproducible stream per (game, market)
    return *simulation_.mc_seed + static_cast<uint64_t>(ordinal) * 3
           + static_cast<uint64_t>(kind);
}

std::vector<Ticket> rank_tickets(std::vector<Ticket> tickets, size_t top_n) {
    std::stable_sort(tickets.begin(), tickets.end(), [](const Ticket& a, const Ticket& b) {
        if (a.edge != b.edge) return a.edge > b.edge;
        return a.kelly_stake > b.kelly_stake;
    });
    if (tickets.size() > top_n) {
        tickets.resize(top_n);
    }
    return tickets;
}

} // namespace gridedge
