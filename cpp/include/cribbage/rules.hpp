/**
 * @file rules.hpp
 * @brief Cribbage rule constants and legality predicates.
 *
 * Standard two-player rules:
 *   - Game to 121 points, checked after every single score addition
 *   - Each player is dealt 6 cards and discards 2 to the dealer's crib
 *   - Play (pegging) counts up to 31, non-dealer leads
 *   - A Jack cut as the starter is "his heels" (2 to the dealer)
 *   - The Jack of the starter's suit in a hand or crib is "nobs" (1 point)
 *
 * All functions are pure and stateless.
 */

#pragma once

#include "card.hpp"
#include <vector>

namespace cribbage {

/** @brief Score that ends the game */
constexpr int WINNING_SCORE = 121;

/** @brief Highest running count allowed during play */
constexpr int MAX_PLAY_COUNT = 31;

/** @brief Cards dealt to each player */
constexpr int INITIAL_HAND_SIZE = 6;

/** @brief Cards each player gives to the crib */
constexpr int CARDS_TO_DISCARD = 2;

/** @brief Cards kept for play and counting */
constexpr int PLAY_HAND_SIZE = 4;

/** @brief Cards in a complete crib */
constexpr int CRIB_SIZE = 4;

/** @brief Points for a Jack cut as the starter */
constexpr int HEELS_POINTS = 2;

/** @brief Win threshold (121) */
inline int win_threshold() { return WINNING_SCORE; }

/** @brief Maximum pegging count (31) */
inline int max_pegging_count() { return MAX_PLAY_COUNT; }

/**
 * @brief Check if a score has reached the winning threshold.
 * @param score Player's current score
 * @return True if score >= 121
 */
inline bool is_game_won(int score) { return score >= WINNING_SCORE; }

/**
 * @brief Check if a card can be played on the current count.
 * @param card Card to check
 * @param current_count Running count of the current cycle
 * @return True if the count would not exceed 31
 */
inline bool can_play_card(Card card, int current_count) {
    return current_count + count_value(card) <= MAX_PLAY_COUNT;
}

/**
 * @brief Check if any card in a hand can be played.
 * @param hand Cards still held
 * @param current_count Running count of the current cycle
 * @return True if at least one card keeps the count at or below 31
 *
 * An empty hand has no legal play.
 */
bool has_legal_play(const std::vector<Card>& hand, int current_count);

/**
 * @brief Check if the starter earns the dealer "his heels".
 * @param starter The cut card
 * @return True if the starter is a Jack
 */
inline bool check_his_heels(Card starter) { return get_rank(starter) == RANK_JACK; }

/**
 * @brief Check for "nobs": the Jack of the starter's suit in hand.
 * @param hand The 4 non-starter cards
 * @param starter The cut card
 * @return True if hand holds a Jack whose suit matches the starter
 */
bool check_nobs(const std::vector<Card>& hand, Card starter);

/**
 * @brief Check that a discard is exactly 2 distinct cards from a 6-card hand.
 * @param hand The dealt hand
 * @param discards Cards chosen for the crib
 * @return True if the discard is legal
 */
bool is_valid_discard(const std::vector<Card>& hand, const std::vector<Card>& discards);

} // namespace cribbage
