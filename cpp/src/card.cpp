/**
 * @file card.cpp
 * @brief Implementation of card utilities and deck management.
 *
 * Provides:
 *   - Rank/suit name conversion and card parsing for logs, tests and bindings
 *   - Hand helpers (removal, uniqueness checks)
 *   - Deck shuffling from a caller-owned std::mt19937_64
 *
 * Determinism: the Deck holds no engine of its own. Identical engine state
 * produces an identical card order across platforms.
 */

#include "../include/cribbage/card.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cribbage {

const char* get_rank_name(int rank) {
    static const char* names[] = {
        "A", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K"
    };
    return (rank >= 0 && rank < NUM_RANKS) ? names[rank] : "?";
}

const char* get_suit_name(int suit) {
    static const char* names[] = {"♣", "♦", "♥", "♠"};
    return (suit >= 0 && suit < NUM_SUITS) ? names[suit] : "?";
}

std::string card_to_string(Card card) {
    if (!is_valid_card(card)) {
        return "??";
    }
    return std::string(get_rank_name(get_rank(card))) + get_suit_name(get_suit(card));
}

namespace {

int parse_rank(const std::string& text) {
    if (text == "10" || text == "T" || text == "t") return RANK_TEN;
    if (text.size() != 1) return -1;

    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    switch (c) {
        case 'A': return RANK_ACE;
        case 'J': return RANK_JACK;
        case 'Q': return RANK_QUEEN;
        case 'K': return RANK_KING;
        default: break;
    }
    if (c >= '2' && c <= '9') {
        return c - '1';
    }
    return -1;
}

int parse_suit(const std::string& text) {
    if (text.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(text[0]))) {
            case 'C': return SUIT_CLUBS;
            case 'D': return SUIT_DIAMONDS;
            case 'H': return SUIT_HEARTS;
            case 'S': return SUIT_SPADES;
            default: return -1;
        }
    }
    // UTF-8 suit symbols
    for (int suit = 0; suit < NUM_SUITS; ++suit) {
        if (text == get_suit_name(suit)) return suit;
    }
    return -1;
}

} // namespace

Card parse_card(const std::string& text) {
    // Rank is "10" or a single character; everything after it is the suit
    size_t rank_len = (text.size() > 2 && text[0] == '1' && text[1] == '0') ? 2 : 1;
    if (text.size() <= rank_len) {
        throw std::invalid_argument("Invalid card: '" + text + "'");
    }

    int rank = parse_rank(text.substr(0, rank_len));
    int suit = parse_suit(text.substr(rank_len));
    if (rank < 0 || suit < 0) {
        throw std::invalid_argument("Invalid card: '" + text + "'");
    }
    return make_card(rank, suit);
}

std::string cards_to_string(const std::vector<Card>& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += ",";
        out += card_to_string(cards[i]);
    }
    return out;
}

std::vector<Card> parse_cards(const std::string& text) {
    std::vector<Card> cards;
    std::string token;
    for (size_t i = 0; i <= text.size(); ++i) {
        bool separator = i == text.size() || text[i] == ',' ||
                         std::isspace(static_cast<unsigned char>(text[i]));
        if (separator) {
            if (!token.empty()) {
                cards.push_back(parse_card(token));
                token.clear();
            }
        } else {
            token += text[i];
        }
    }
    return cards;
}

bool all_unique(const std::vector<Card>& cards) {
    uint64_t seen = 0;
    for (Card c : cards) {
        if (!is_valid_card(c)) return false;
        uint64_t bit = uint64_t{1} << c;
        if (seen & bit) return false;
        seen |= bit;
    }
    return true;
}

bool holds_card(const Hand& hand, Card card) {
    return std::find(hand.begin(), hand.end(), card) != hand.end();
}

void remove_cards(Hand& hand, const std::vector<Card>& cards) {
    Hand remaining = hand;
    for (Card c : cards) {
        auto it = std::find(remaining.begin(), remaining.end(), c);
        if (it == remaining.end()) {
            throw std::invalid_argument("Card " + card_to_string(c) + " is not in hand");
        }
        remaining.erase(it);
    }
    hand.swap(remaining);
}

Deck::Deck() : draw_idx_(0) {
    deck_.reserve(DECK_SIZE);
    reset();
}

void Deck::reset() {
    deck_.clear();
    draw_idx_ = 0;

    for (int i = 0; i < DECK_SIZE; ++i) {
        deck_.push_back(static_cast<Card>(i));
    }
}

void Deck::shuffle(std::mt19937_64& rng) {
    // Only the undealt part moves; dealt cards stay out of play
    std::shuffle(deck_.begin() + static_cast<std::ptrdiff_t>(draw_idx_), deck_.end(), rng);
}

Card Deck::draw() {
    if (is_empty()) {
        throw std::out_of_range("Cannot deal from an exhausted deck");
    }
    return deck_[draw_idx_++];
}

} // namespace cribbage
