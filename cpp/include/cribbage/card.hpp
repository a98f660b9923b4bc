/**
 * @file card.hpp
 * @brief Card encoding, deck management, and hand containers for cribbage.
 *
 * This file defines the fundamental card data structures used throughout the simulator.
 * Cards are encoded as single bytes (0-51) using the formula: rank * 4 + suit.
 * This compact encoding enables efficient storage and fast rank/suit extraction.
 *
 * Encoding scheme:
 *   - Ranks: 0=A, 1=2, 2=3, ..., 9=10, 10=J, 11=Q, 12=K (Ace is always low)
 *   - Suits: 0=Clubs, 1=Diamonds, 2=Hearts, 3=Spades
 *   - Example: King of Spades = 12 * 4 + 3 = 51
 *   - Example: Ace of Clubs = 0 * 4 + 0 = 0
 *
 * Two derived values drive all scoring:
 *   - count value: A=1, 2-10 face value, J/Q/K=10 (fifteens and the 31 count)
 *   - run value:   A=1 ... K=13 (runs, plus the Jack checks for heels and nobs)
 *
 * The Deck class never owns a random engine. The caller passes the engine to
 * shuffle(), so a single seeded source per game decides every card order.
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief Card type encoded as a single byte (0-51).
 *
 * Card value = rank * 4 + suit, where:
 *   - rank: 0-12 (Ace through King)
 *   - suit: 0-3 (Clubs, Diamonds, Hearts, Spades)
 *
 * Use get_rank() and get_suit() to extract components.
 * Use make_card() to construct from rank and suit.
 */
using Card = uint8_t;

/** @brief Total number of ranks in a standard deck (Ace through King) */
constexpr int NUM_RANKS = 13;

/** @brief Total number of suits (Clubs, Diamonds, Hearts, Spades) */
constexpr int NUM_SUITS = 4;

/** @brief Total cards in a standard deck */
constexpr int DECK_SIZE = 52;

/** @brief Rank indices used by the rules */
constexpr int RANK_ACE = 0;
constexpr int RANK_FIVE = 4;
constexpr int RANK_TEN = 9;
constexpr int RANK_JACK = 10;
constexpr int RANK_QUEEN = 11;
constexpr int RANK_KING = 12;

/** @brief Suit indices */
constexpr int SUIT_CLUBS = 0;
constexpr int SUIT_DIAMONDS = 1;
constexpr int SUIT_HEARTS = 2;
constexpr int SUIT_SPADES = 3;

/**
 * @brief Extract rank from card encoding.
 * @param card Card value (0-51)
 * @return Rank index (0-12, where 0=A, 12=K)
 */
inline int get_rank(Card card) { return card / NUM_SUITS; }

/**
 * @brief Extract suit from card encoding.
 * @param card Card value (0-51)
 * @return Suit index (0=Clubs, 1=Diamonds, 2=Hearts, 3=Spades)
 */
inline int get_suit(Card card) { return card % NUM_SUITS; }

/**
 * @brief Construct a card from rank and suit indices.
 * @param rank Rank index (0-12)
 * @param suit Suit index (0-3)
 * @return Encoded card value (0-51)
 */
inline Card make_card(int rank, int suit) {
    return static_cast<Card>(rank * NUM_SUITS + suit);
}

/** @brief True if the byte is a valid card encoding (0-51) */
inline bool is_valid_card(Card card) { return card < DECK_SIZE; }

/**
 * @brief Value of a card when counting to 15 or 31.
 * @param card Card value (0-51)
 * @return 1 for Ace, face value for 2-10, 10 for J/Q/K
 */
inline int count_value(Card card) {
    int rank = get_rank(card);
    return rank < RANK_TEN ? rank + 1 : 10;
}

/**
 * @brief Ordinal of a card used for runs.
 * @param card Card value (0-51)
 * @return 1 for Ace through 13 for King
 */
inline int run_value(Card card) { return get_rank(card) + 1; }

/**
 * @brief Get human-readable rank name.
 * @param rank Rank index (0-12)
 * @return Rank name string ("A", "2", ..., "10", "J", "Q", "K")
 */
const char* get_rank_name(int rank);

/**
 * @brief Get human-readable suit symbol.
 * @param suit Suit index (0-3)
 * @return Suit symbol ("♣", "♦", "♥", "♠")
 */
const char* get_suit_name(int suit);

/**
 * @brief Format a card as rank followed by suit symbol, e.g. "J♥".
 * @param card Card value (0-51)
 * @return Display string, "??" for an invalid encoding
 */
std::string card_to_string(Card card);

/**
 * @brief Parse a card from text such as "5H", "10s", "Jd" or "A♣".
 * @param text Rank ("A", "2"-"10", "T", "J", "Q", "K") followed by a suit
 *             letter (C/D/H/S, any case) or suit symbol
 * @return Encoded card
 * @throws std::invalid_argument if the text is not a card
 */
Card parse_card(const std::string& text);

/**
 * @brief Unordered multiset of cards held by one player for one deal.
 *
 * Starts at 6 cards after the deal and drops to 4 after the discard.
 * The crib uses the same container.
 */
using Hand = std::vector<Card>;

/** @brief The dealer's extra hand built from four discards */
using Crib = std::vector<Card>;

/**
 * @brief Join cards as a comma separated display string.
 * @param cards Cards to format
 * @return e.g. "5♠,5♣,J♥"
 */
std::string cards_to_string(const std::vector<Card>& cards);

/**
 * @brief Parse a whitespace or comma separated list of cards.
 * @param text e.g. "5S 5C 5D JH"
 * @return Cards in the order given
 * @throws std::invalid_argument on any bad token
 */
std::vector<Card> parse_cards(const std::string& text);

/**
 * @brief Check that a set of cards holds no card twice.
 * @param cards Cards to check
 * @return True if every card is valid and unique
 */
bool all_unique(const std::vector<Card>& cards);

/**
 * @brief Remove specific cards from a hand.
 * @param hand Hand to modify
 * @param cards Cards to take out (each must be held)
 * @throws std::invalid_argument if a card is not held; the hand is
 *         left unchanged in that case
 */
void remove_cards(Hand& hand, const std::vector<Card>& cards);

/**
 * @brief Check whether a hand holds a card.
 * @param hand Hand to search
 * @param card Card to look for
 */
bool holds_card(const Hand& hand, Card card);

/**
 * @brief Manages a 52-card deck with seeded shuffling and sequential dealing.
 *
 * Each card can be dealt at most once between resets. The deck draws its
 * order from an engine owned by the caller so that a game's deck and its
 * players can use separate, independently seeded streams.
 *
 * Usage:
 * @code
 *   std::mt19937_64 rng(42);
 *   Deck deck;
 *   deck.reset();
 *   deck.shuffle(rng);  // Seed 42 always produces same order
 *   Card c1 = deck.draw();
 * @endcode
 */
class Deck {
public:
    /** @brief Construct a full, unshuffled deck */
    Deck();

    /**
     * @brief Restore all 52 cards in canonical order.
     *
     * Every card dealt since the previous reset returns to the deck.
     */
    void reset();

    /**
     * @brief Shuffle the cards not yet dealt.
     * @param rng Engine supplied by the owner (same state = same order)
     */
    void shuffle(std::mt19937_64& rng);

    /**
     * @brief Deal one card from the top of the deck.
     * @return Card value (0-51)
     * @throws std::out_of_range if every card has already been dealt
     */
    Card draw();

    /**
     * @brief Check if the deck is exhausted.
     * @return True if no cards remain to be dealt
     */
    bool is_empty() const { return draw_idx_ >= deck_.size(); }

    /**
     * @brief Get count of cards remaining in the deck.
     * @return Number of cards that can still be dealt
     */
    int remaining() const { return static_cast<int>(deck_.size() - draw_idx_); }

private:
    std::vector<Card> deck_; ///< All 52 cards, dealt front to back
    size_t draw_idx_;        ///< Index of next card to deal
};

} // namespace cribbage
