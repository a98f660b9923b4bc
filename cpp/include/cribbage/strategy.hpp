/**
 * @file strategy.hpp
 * @brief Pluggable discard/play decisions for a cribbage player.
 *
 * The game state machine only talks to the Strategy interface. It asks for
 * a discard once per deal and for a card only when the player actually has
 * a legal play; "go" is decided by the game, never by the strategy.
 *
 * Randomness comes from an engine owned by the Game and passed into every
 * call, so a strategy holds no random state of its own.
 */

#pragma once

#include "card.hpp"
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief A strategy broke its contract (bad discard, illegal or unheld play).
 *
 * This signals a broken policy implementation, not a game condition, and is
 * fatal for the current run.
 */
class PolicyError : public std::logic_error {
public:
    explicit PolicyError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Decision-making capability for one seat.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    /**
     * @brief Choose two cards to give to the crib.
     * @param hand The 6 dealt cards
     * @param is_dealer True if the crib belongs to this player
     * @param rng Game-owned engine for any random choice
     * @return Exactly 2 distinct cards taken from hand
     */
    virtual std::vector<Card> choose_discards(const Hand& hand, bool is_dealer,
                                              std::mt19937_64& rng) = 0;

    /**
     * @brief Choose a card to play during pegging.
     * @param hand Cards still held (at least one is playable)
     * @param current_count Running count of the current cycle
     * @param sequence Cards played in the current cycle
     * @param rng Game-owned engine for any random choice
     * @return A held card with count_value <= 31 - current_count
     */
    virtual Card choose_play(const Hand& hand, int current_count,
                             const std::vector<Card>& sequence,
                             std::mt19937_64& rng) = 0;

    /** @brief Short label used in logs */
    virtual std::string name() const = 0;
};

/**
 * @brief Uninformed default strategy.
 *
 * Discards two cards uniformly at random. Plays either the first legal card
 * in hand order or a uniformly random legal card.
 */
class RandomStrategy final : public Strategy {
public:
    /** @brief How the card to play is picked among legal cards */
    enum PlayOrder {
        FIRST_LEGAL = 0, ///< First playable card in hand order
        RANDOM_LEGAL = 1 ///< Uniform choice among playable cards
    };

    explicit RandomStrategy(PlayOrder order = FIRST_LEGAL) : order_(order) {}

    std::vector<Card> choose_discards(const Hand& hand, bool is_dealer,
                                      std::mt19937_64& rng) override;

    Card choose_play(const Hand& hand, int current_count,
                     const std::vector<Card>& sequence,
                     std::mt19937_64& rng) override;

    std::string name() const override;

    PlayOrder play_order() const { return order_; }

private:
    PlayOrder order_;
};

} // namespace cribbage
