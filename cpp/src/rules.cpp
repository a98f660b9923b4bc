/**
 * @file rules.cpp
 * @brief Legality predicates for discards, pegging plays, heels and nobs.
 */

#include "../include/cribbage/rules.hpp"
#include <algorithm>

namespace cribbage {

bool has_legal_play(const std::vector<Card>& hand, int current_count) {
    return std::any_of(hand.begin(), hand.end(), [current_count](Card c) {
        return can_play_card(c, current_count);
    });
}

bool check_nobs(const std::vector<Card>& hand, Card starter) {
    int starter_suit = get_suit(starter);
    return std::any_of(hand.begin(), hand.end(), [starter_suit](Card c) {
        return get_rank(c) == RANK_JACK && get_suit(c) == starter_suit;
    });
}

bool is_valid_discard(const std::vector<Card>& hand, const std::vector<Card>& discards) {
    if (hand.size() != INITIAL_HAND_SIZE || discards.size() != CARDS_TO_DISCARD) {
        return false;
    }
    if (discards[0] == discards[1]) {
        return false;
    }
    return holds_card(hand, discards[0]) && holds_card(hand, discards[1]);
}

} // namespace cribbage
