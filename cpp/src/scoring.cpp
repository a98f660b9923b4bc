/**
 * @file scoring.cpp
 * @brief Implementation of count-phase and pegging scoring.
 *
 * Count phase works on the 5 count cards (4 held + starter):
 *   - Fifteens: all 2^5 subsets by bitmask, sizes below 2 skipped
 *   - Pairs:    rank histogram, n*(n-1) per rank
 *   - Runs:     histogram over run values 1-13, scan for maximal regions
 *               of non-zero counts, score the longest ones only
 *   - Flush and nobs look at the 4 held cards and the starter separately
 *
 * Pegging looks only at the tail of the current cycle:
 *   - Pairs: walk back while the rank matches the card just played
 *   - Runs:  try the longest tail first, shrinking to 3; a tail qualifies
 *            when its k run values are distinct and span exactly k-1
 */

#include "../include/cribbage/scoring.hpp"
#include "../include/cribbage/rules.hpp"
#include <algorithm>
#include <stdexcept>

namespace cribbage {

const char* category_name(ScoreCategory category) {
    static const char* names[] = {
        "fifteens", "pairs", "runs", "flush", "nobs",
        "play-fifteen", "play-pair", "play-run", "play-go", "play-thirty-one",
        "heels"
    };
    return names[static_cast<int>(category)];
}

bool is_count_category(ScoreCategory category) {
    return static_cast<int>(category) <= static_cast<int>(ScoreCategory::NOBS);
}

int ScoreBreakdown::total() const {
    int sum = 0;
    for (int p : points) {
        sum += p;
    }
    return sum;
}

std::map<std::string, int> ScoreBreakdown::to_map() const {
    std::map<std::string, int> out;
    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        if (points[i] != 0) {
            out[category_name(static_cast<ScoreCategory>(i))] = points[i];
        }
    }
    return out;
}

std::string ScoreBreakdown::describe() const {
    std::string out;
    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        if (points[i] == 0) continue;
        if (!out.empty()) out += ", ";
        out += category_name(static_cast<ScoreCategory>(i));
        out += " " + std::to_string(points[i]);
    }
    return out;
}

ScoreBreakdown& ScoreBreakdown::operator+=(const ScoreBreakdown& other) {
    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        points[i] += other.points[i];
    }
    return *this;
}

bool operator==(const ScoreBreakdown& a, const ScoreBreakdown& b) {
    return a.points == b.points;
}

bool operator!=(const ScoreBreakdown& a, const ScoreBreakdown& b) {
    return !(a == b);
}

namespace {

// Helper: count occurrences of each rank
std::array<int, NUM_RANKS> count_ranks(const std::vector<Card>& cards) {
    std::array<int, NUM_RANKS> counts = {};
    for (Card c : cards) {
        counts[get_rank(c)]++;
    }
    return counts;
}

// Helper: reject invalid encodings and repeated cards
void require_distinct(const std::vector<Card>& cards, const char* caller) {
    if (!all_unique(cards)) {
        throw std::invalid_argument(std::string(caller) + " given invalid or repeated cards: " +
                                    cards_to_string(cards));
    }
}

// Helper: same check over held cards plus the starter
void require_distinct(const std::vector<Card>& hand, Card starter, const char* caller) {
    std::vector<Card> all_cards(hand);
    all_cards.push_back(starter);
    require_distinct(all_cards, caller);
}

} // namespace

int score_fifteens(const std::vector<Card>& cards) {
    require_distinct(cards, "score_fifteens");
    if (cards.size() > 5) {
        throw std::invalid_argument("score_fifteens expects at most 5 cards, got " +
                                    std::to_string(cards.size()));
    }

    const int n = static_cast<int>(cards.size());
    int fifteens = 0;

    for (int mask = 0; mask < (1 << n); ++mask) {
        int size = 0;
        int sum = 0;
        for (int i = 0; i < n; ++i) {
            if (mask & (1 << i)) {
                ++size;
                sum += count_value(cards[i]);
            }
        }
        if (size >= 2 && sum == 15) {
            ++fifteens;
        }
    }

    return fifteens * 2;
}

int score_pairs(const std::vector<Card>& cards) {
    require_distinct(cards, "score_pairs");
    auto counts = count_ranks(cards);
    int points = 0;
    for (int n : counts) {
        points += n * (n - 1);
    }
    return points;
}

int score_runs(const std::vector<Card>& cards) {
    require_distinct(cards, "score_runs");

    // Rank index == run value - 1, so the rank histogram is already ordered
    auto counts = count_ranks(cards);

    struct Region {
        int length;
        int combinations;
    };
    std::vector<Region> regions;

    int rank = 0;
    while (rank < NUM_RANKS) {
        if (counts[rank] == 0) {
            ++rank;
            continue;
        }
        Region region = {0, 1};
        while (rank < NUM_RANKS && counts[rank] > 0) {
            region.length++;
            region.combinations *= counts[rank];
            ++rank;
        }
        regions.push_back(region);
    }

    int longest = 0;
    for (const Region& r : regions) {
        longest = std::max(longest, r.length);
    }
    if (longest < 3) {
        return 0;
    }

    int points = 0;
    for (const Region& r : regions) {
        if (r.length == longest) {
            points += r.length * r.combinations;
        }
    }
    return points;
}

int score_flush(const std::vector<Card>& hand, Card starter, bool is_crib) {
    require_distinct(hand, starter, "score_flush");
    if (hand.size() != PLAY_HAND_SIZE) {
        return 0;
    }

    int suit = get_suit(hand[0]);
    bool all_same = std::all_of(hand.begin(), hand.end(), [suit](Card c) {
        return get_suit(c) == suit;
    });
    if (!all_same) {
        return 0;
    }

    bool starter_matches = get_suit(starter) == suit;
    if (starter_matches) {
        return 5;
    }
    // A four-card flush never counts in the crib
    return is_crib ? 0 : 4;
}

int score_nobs(const std::vector<Card>& hand, Card starter) {
    require_distinct(hand, starter, "score_nobs");
    return check_nobs(hand, starter) ? 1 : 0;
}

ScoreBreakdown score_hand(const std::vector<Card>& hand, Card starter, bool is_crib) {
    if (hand.size() != PLAY_HAND_SIZE) {
        throw std::invalid_argument("score_hand expects " + std::to_string(PLAY_HAND_SIZE) +
                                    " cards, got " + std::to_string(hand.size()));
    }

    require_distinct(hand, starter, "score_hand");
    std::vector<Card> all_cards(hand);
    all_cards.push_back(starter);

    ScoreBreakdown breakdown;
    breakdown.add(ScoreCategory::FIFTEENS, score_fifteens(all_cards));
    breakdown.add(ScoreCategory::PAIRS, score_pairs(all_cards));
    breakdown.add(ScoreCategory::RUNS, score_runs(all_cards));
    breakdown.add(ScoreCategory::FLUSH, score_flush(hand, starter, is_crib));
    breakdown.add(ScoreCategory::NOBS, score_nobs(hand, starter));
    return breakdown;
}

int play_count(const std::vector<Card>& sequence) {
    int count = 0;
    for (Card c : sequence) {
        count += count_value(c);
    }
    return count;
}

int trailing_pair_length(const std::vector<Card>& sequence) {
    if (sequence.empty()) {
        return 0;
    }

    int last_rank = get_rank(sequence.back());
    int length = 1;
    for (size_t i = sequence.size() - 1; i-- > 0;) {
        if (get_rank(sequence[i]) != last_rank) {
            break;
        }
        ++length;
    }
    return length;
}

int trailing_run_length(const std::vector<Card>& sequence) {
    const int n = static_cast<int>(sequence.size());

    for (int k = n; k >= 3; --k) {
        std::vector<int> values;
        values.reserve(k);
        for (int i = n - k; i < n; ++i) {
            values.push_back(run_value(sequence[i]));
        }
        std::sort(values.begin(), values.end());

        bool distinct = std::adjacent_find(values.begin(), values.end()) == values.end();
        if (distinct && values.back() - values.front() == k - 1) {
            return k;
        }
    }
    return 0;
}

ScoreBreakdown score_play(const std::vector<Card>& sequence, Card card) {
    std::vector<Card> played(sequence);
    played.push_back(card);
    require_distinct(played, "score_play");

    int count = play_count(sequence);
    if (!can_play_card(card, count)) {
        throw std::invalid_argument("Playing " + card_to_string(card) + " on " +
                                    std::to_string(count) + " exceeds " +
                                    std::to_string(MAX_PLAY_COUNT));
    }

    count += count_value(card);

    ScoreBreakdown breakdown;
    if (count == 15) {
        breakdown.add(ScoreCategory::PLAY_FIFTEEN, 2);
    }
    if (count == MAX_PLAY_COUNT) {
        breakdown.add(ScoreCategory::PLAY_THIRTY_ONE, 2);
    }

    // 2 cards = 2, 3 = 6, 4 = 12: every pair inside the streak scores 2
    int streak = trailing_pair_length(played);
    if (streak >= 2) {
        breakdown.add(ScoreCategory::PLAY_PAIR, streak * (streak - 1));
    }

    int run = trailing_run_length(played);
    if (run > 0) {
        breakdown.add(ScoreCategory::PLAY_RUN, run);
    }

    return breakdown;
}

} // namespace cribbage
