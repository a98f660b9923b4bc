/**
 * @file strategy.cpp
 * @brief Random discard and play policies.
 *
 * RandomStrategy draws only from the engine it is handed, so a game seed
 * fixes every decision. Illegal requests raise PolicyError.
 */

#include "../include/cribbage/strategy.hpp"
#include "../include/cribbage/rules.hpp"

namespace cribbage {

std::vector<Card> RandomStrategy::choose_discards(const Hand& hand, bool is_dealer,
                                                  std::mt19937_64& rng) {
    (void)is_dealer;

    if (hand.size() != INITIAL_HAND_SIZE) {
        throw PolicyError("Cannot discard from hand of size " + std::to_string(hand.size()));
    }

    // Two distinct positions: pick one, then one of the remaining five
    std::uniform_int_distribution<size_t> first_dist(0, hand.size() - 1);
    size_t first = first_dist(rng);
    std::uniform_int_distribution<size_t> second_dist(0, hand.size() - 2);
    size_t second = second_dist(rng);
    if (second >= first) {
        ++second;
    }

    return {hand[first], hand[second]};
}

Card RandomStrategy::choose_play(const Hand& hand, int current_count,
                                 const std::vector<Card>& sequence,
                                 std::mt19937_64& rng) {
    (void)sequence;

    std::vector<Card> playable;
    for (Card c : hand) {
        if (can_play_card(c, current_count)) {
            playable.push_back(c);
        }
    }
    if (playable.empty()) {
        throw PolicyError("choose_play called without a legal play on count " +
                          std::to_string(current_count));
    }

    if (order_ == FIRST_LEGAL) {
        return playable.front();
    }
    std::uniform_int_distribution<size_t> dist(0, playable.size() - 1);
    return playable[dist(rng)];
}

std::string RandomStrategy::name() const {
    return order_ == FIRST_LEGAL ? "random-discard/first-legal" : "random-discard/random-legal";
}

} // namespace cribbage
