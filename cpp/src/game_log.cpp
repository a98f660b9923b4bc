/**
 * @file game_log.cpp
 * @brief Text log of deals and games, filtered by verbosity.
 *
 * Level 1 prints heels, the count and game results. Level 2 adds deal
 * headers and pegging events. Dealt hands and discards need debug.
 */

#include "../include/cribbage/game_log.hpp"
#include <sstream>

namespace cribbage {

namespace {

const std::string RULE(60, '=');

} // namespace

GameLogger::GameLogger(std::ostream& out, int verbosity, bool debug)
    : verbosity_(verbosity), debug_(debug) {
    sinks_.push_back(&out);
}

void GameLogger::add_sink(std::ostream& out) {
    sinks_.push_back(&out);
}

void GameLogger::log(const std::string& message, int level, bool debug_only) {
    if (debug_only && !debug_) {
        return;
    }
    if (verbosity_ < level && !debug_) {
        return;
    }
    for (std::ostream* sink : sinks_) {
        *sink << message << "\n";
    }
}

void GameLogger::on_deal_complete(const DealRecord& record) {
    const std::string& dealer = record.players[record.dealer].name;

    log(RULE, 2);
    log("GAME " + std::to_string(record.game_id) + " HAND " + std::to_string(record.hand_id) +
        " (dealer: " + dealer + ")", 2);
    log(RULE, 2);

    for (const PlayerDealRecord& p : record.players) {
        log(p.name + " dealt: " + cards_to_string(p.dealt), 2, true);
        log(p.name + " discarded: " + cards_to_string(p.discards), 2, true);
    }
    log("Crib: " + cards_to_string(record.crib), 2, true);

    log("Starter card: " + card_to_string(record.starter), 2);
    if (record.his_heels) {
        log("His heels! " + dealer + " scores 2.", 1);
    }

    log_pegging(record);

    int non_dealer = 1 - record.dealer;
    const PlayerDealRecord& nd = record.players[non_dealer];
    const PlayerDealRecord& d = record.players[record.dealer];
    if (nd.hand_counted) {
        log("Counting phase...", 1);
        log_count(nd, nd.kept, nd.hand_breakdown, record.starter, false);
    }
    if (d.hand_counted) {
        log_count(d, d.kept, d.hand_breakdown, record.starter, false);
    }
    if (record.crib_counted) {
        log_count(d, record.crib, record.crib_breakdown, record.starter, true);
    }

    std::ostringstream scores;
    scores << "Scores: " << record.players[0].name << " " << record.players[0].score_after
           << ", " << record.players[1].name << " " << record.players[1].score_after;
    log(scores.str(), 1);
}

void GameLogger::log_pegging(const DealRecord& record) {
    log("Play phase (pegging)...", 2);

    for (const PeggingEvent& e : record.pegging) {
        const std::string& name = record.players[e.player].name;
        if (e.action == TurnAction::PLAYED) {
            log(name + " plays " + card_to_string(e.card) + " (count: " +
                std::to_string(e.count) + ")", 2);
        } else if (e.action == TurnAction::GO) {
            log(name + " says Go.", 2);
        }

        if (e.scorer >= 0 && !e.breakdown.empty()) {
            const std::string& scorer = record.players[e.scorer].name;
            log(scorer + " scores " + std::to_string(e.breakdown.total()) + " (" +
                e.breakdown.describe() + ").", 1);
        }
        if (e.cycle_reset) {
            log("Count resets to 0.", 2);
        }
    }
}

void GameLogger::log_count(const PlayerDealRecord& player, const std::vector<Card>& cards,
                           const ScoreBreakdown& breakdown, Card starter, bool is_crib) {
    log(player.name + "'s " + (is_crib ? "crib" : "hand") + ": " + cards_to_string(cards) +
        " + starter " + card_to_string(starter), 1);

    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        if (breakdown.points[i] > 0) {
            log(std::string("  ") + category_name(static_cast<ScoreCategory>(i)) + ": " +
                std::to_string(breakdown.points[i]), 2);
        }
    }
    log(player.name + " scores " + std::to_string(breakdown.total()) + " points.", 1);
}

void GameLogger::on_game_complete(const GameSummary& summary) {
    log(RULE, 1);
    log("GAME " + std::to_string(summary.game_id) + " OVER! " + summary.winner_name() +
        " wins with " + std::to_string(summary.final_scores[summary.winner]) + " points.", 1);
    for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
        std::ostringstream line;
        line << "  " << summary.names[seat] << ": " << summary.final_scores[seat]
             << " (play " << summary.play_points[seat]
             << ", count " << summary.count_points[seat]
             << ", heels " << summary.heels_points[seat] << ")";
        log(line.str(), 1);
    }
    log("  Hands played: " + std::to_string(summary.hands_played), 1);
    if (summary.seed_tracked) {
        log("  Game " + std::to_string(summary.game_id) + " random seed: " +
            std::to_string(summary.seed), 1);
    }
    log(RULE, 1);
}

} // namespace cribbage
