// Example usage of the scoring engine and the game state machine

#include "../include/cribbage/card.hpp"
#include "../include/cribbage/game.hpp"
#include "../include/cribbage/scoring.hpp"
#include <iostream>
#include <iomanip>

using namespace cribbage;

void print_breakdown(const std::string& label, const ScoreBreakdown& breakdown) {
    std::cout << "\n=== " << label << " ===" << std::endl;
    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        if (breakdown.points[i] > 0) {
            std::cout << "  " << std::setw(16) << std::left
                      << category_name(static_cast<ScoreCategory>(i))
                      << breakdown.points[i] << std::endl;
        }
    }
    std::cout << "  " << std::setw(16) << std::left << "total" << breakdown.total() << std::endl;
}

int main() {
    std::cout << "=== Cribbage Scoring Engine Example ===" << std::endl;

    // Example 1: the 29 hand
    Hand best = parse_cards("5S 5C 5D JH");
    print_breakdown("5♠ 5♣ 5♦ J♥ + 5♥", score_hand(best, parse_card("5H")));

    // Example 2: double run with a starter that extends it
    Hand double_run = parse_cards("4C 5D 5H 6S");
    print_breakdown("4♣ 5♦ 5♥ 6♠ + 7♣", score_hand(double_run, parse_card("7C")));

    // Example 3: the same four suited cards as hand and as crib
    Hand suited = parse_cards("2H 4H 8H QH");
    print_breakdown("hand 2♥ 4♥ 8♥ Q♥ + K♠", score_hand(suited, parse_card("KS"), false));
    print_breakdown("crib 2♥ 4♥ 8♥ Q♥ + K♠", score_hand(suited, parse_card("KS"), true));

    // Example 4: pegging a 7 onto 5-6 reaching 18 for a run of three
    std::vector<Card> sequence = parse_cards("5C 6D");
    print_breakdown("peg 7♥ on 5♣ 6♦", score_play(sequence, parse_card("7H")));

    // Example 5: one full game, deal by deal
    std::cout << "\n\n--- Example 5: Playing a game with seed 42 ---" << std::endl;
    GameConfig config;
    config.seed = 42;
    Game game(config,
              std::unique_ptr<Strategy>(new RandomStrategy()),
              std::unique_ptr<Strategy>(new RandomStrategy()));

    while (!game.is_over()) {
        const DealRecord& deal = game.play_deal();
        std::cout << "Hand " << deal.hand_id << ": starter " << card_to_string(deal.starter)
                  << ", scores " << deal.players[0].score_after << " - "
                  << deal.players[1].score_after << std::endl;
    }

    const GameSummary& summary = game.summary();
    std::cout << "\nWinner: " << summary.winner_name() << " after "
              << summary.hands_played << " hands" << std::endl;

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
