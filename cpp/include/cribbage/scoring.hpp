/**
 * @file scoring.hpp
 * @brief Cribbage scoring for the count phase and for pegging.
 *
 * Every scoring event produces a ScoreBreakdown: points per named category.
 * The breakdown is the authoritative record of an award; its total() is
 * exactly what is added to the owning player's score.
 *
 * Count phase (4 cards + starter):
 *   | Category | Points                                                  |
 *   |----------|---------------------------------------------------------|
 *   | fifteens | 2 per subset (size >= 2) summing to 15                  |
 *   | pairs    | n*(n-1) per rank held n times (2, 6, 12)                |
 *   | runs     | longest run length x product of rank multiplicities     |
 *   | flush    | hand: 4 (5 with starter); crib: 5 only with starter     |
 *   | nobs     | 1 for the Jack of the starter's suit                    |
 *
 * Pegging (per card played):
 *   | Category        | Points                                          |
 *   |-----------------|-------------------------------------------------|
 *   | play-fifteen    | 2 when the count reaches 15                     |
 *   | play-thirty-one | 2 when the count reaches 31                     |
 *   | play-pair       | 2 / 6 / 12 for a trailing streak of 2 / 3 / 4   |
 *   | play-run        | k for the longest trailing k-card run (k >= 3)  |
 *   | play-go         | 1 to the last player when nobody can continue   |
 *
 * "heels" (2 to the dealer for a Jack starter) is awarded by the game.
 *
 * Example: 5♠ 5♣ 5♦ J♥ with starter 5♥
 *   - fifteens = 16 (four 5+5+5, four J+5)
 *   - pairs    = 12 (four fives)
 *   - nobs     = 1  (J♥ matches the starter)
 *   - Total: 29
 */

#pragma once

#include "card.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief Named scoring categories.
 *
 * The first five are count-phase categories, the next five pegging
 * categories, and HEELS is awarded on the cut.
 */
enum class ScoreCategory {
    FIFTEENS = 0,
    PAIRS,
    RUNS,
    FLUSH,
    NOBS,
    PLAY_FIFTEEN,
    PLAY_PAIR,
    PLAY_RUN,
    PLAY_GO,
    PLAY_THIRTY_ONE,
    HEELS
};

/** @brief Number of ScoreCategory values */
constexpr int NUM_CATEGORIES = 11;

/**
 * @brief Export name of a category.
 * @param category Category to name
 * @return "fifteens", "pairs", "runs", "flush", "nobs", "play-fifteen",
 *         "play-pair", "play-run", "play-go", "play-thirty-one" or "heels"
 */
const char* category_name(ScoreCategory category);

/** @brief True for the five count-phase categories */
bool is_count_category(ScoreCategory category);

/**
 * @brief Points per category for one scoring event.
 *
 * Categories are additive. All values are non-negative.
 */
struct ScoreBreakdown {
    std::array<int, NUM_CATEGORIES> points; ///< Indexed by ScoreCategory

    /** @brief Default constructor: zero in every category */
    ScoreBreakdown() : points{} {}

    /** @brief Points recorded for one category */
    int get(ScoreCategory category) const { return points[static_cast<int>(category)]; }

    /** @brief Add points to one category */
    void add(ScoreCategory category, int pts) { points[static_cast<int>(category)] += pts; }

    /** @brief Sum over all categories */
    int total() const;

    /** @brief True if nothing was scored */
    bool empty() const { return total() == 0; }

    /**
     * @brief Export form: category name to points, non-zero categories only.
     *
     * The values of the returned map sum to total().
     */
    std::map<std::string, int> to_map() const;

    /**
     * @brief Human-readable list such as "fifteens 4, runs 3".
     * @return Empty string when nothing was scored
     */
    std::string describe() const;

    /** @brief Accumulate another breakdown into this one */
    ScoreBreakdown& operator+=(const ScoreBreakdown& other);
};

bool operator==(const ScoreBreakdown& a, const ScoreBreakdown& b);
bool operator!=(const ScoreBreakdown& a, const ScoreBreakdown& b);

// ============================================================================
// Count phase
// ============================================================================

/**
 * @brief Score a 4-card hand or crib together with the starter.
 * @param hand The 4 kept cards (or the 4 crib cards)
 * @param starter The shared cut card
 * @param is_crib True for the crib (only a 5-card flush scores)
 * @return Breakdown over fifteens, pairs, runs, flush and nobs
 * @throws std::invalid_argument if hand is not 4 cards or any card is
 *         invalid or repeated (starter included)
 */
ScoreBreakdown score_hand(const std::vector<Card>& hand, Card starter, bool is_crib = false);

/**
 * @brief Points for fifteens: 2 per subset of 2+ cards summing to 15.
 * @param cards Cards to examine (typically the 5 count cards)
 * @throws std::invalid_argument on more than 5 cards, or on invalid or
 *         repeated cards
 *
 * Enumerates all subsets by bitmask; with 5 cards that is 32 masks.
 */
int score_fifteens(const std::vector<Card>& cards);

/**
 * @brief Points for pairs: n*(n-1) for each rank held n times.
 * @param cards Cards to examine
 * @throws std::invalid_argument on invalid or repeated cards
 */
int score_pairs(const std::vector<Card>& cards);

/**
 * @brief Points for runs of 3+ distinct consecutive ranks.
 * @param cards Cards to examine
 * @throws std::invalid_argument on invalid or repeated cards
 *
 * Finds maximal consecutive regions of distinct run values. Only regions
 * of the longest length L score, each worth L times the product of the
 * multiplicities of its ranks (so 4-5-5-6 is a double run of three = 6).
 * Disjoint regions of equal length each score.
 */
int score_runs(const std::vector<Card>& cards);

/**
 * @brief Points for a flush.
 * @param hand The 4 non-starter cards
 * @param starter The cut card
 * @param is_crib True when scoring the crib
 * @return Hand: 4, or 5 with a matching starter. Crib: 5 or nothing.
 * @throws std::invalid_argument on invalid or repeated cards
 */
int score_flush(const std::vector<Card>& hand, Card starter, bool is_crib);

/**
 * @brief Points for nobs (Jack of the starter's suit).
 * @param hand The 4 non-starter cards
 * @param starter The cut card
 * @throws std::invalid_argument on invalid or repeated cards
 */
int score_nobs(const std::vector<Card>& hand, Card starter);

// ============================================================================
// Pegging
// ============================================================================

/**
 * @brief Running count of a pegging cycle.
 * @param sequence Cards played since the last reset
 */
int play_count(const std::vector<Card>& sequence);

/**
 * @brief Score one card played during pegging.
 * @param sequence Cards played in the current cycle before this card
 * @param card The card being played
 * @return Breakdown over play-fifteen, play-thirty-one, play-pair, play-run
 * @throws std::invalid_argument if the card would take the count past 31,
 *         or if any card is invalid or already in the sequence
 *
 * A run must be a trailing block of distinct consecutive ranks in any
 * order; a repeated rank inside the block disqualifies it. Only the
 * longest qualifying block scores.
 */
ScoreBreakdown score_play(const std::vector<Card>& sequence, Card card);

/**
 * @brief Length of the trailing same-rank streak ending with the last card.
 * @param sequence Cards in play order (last card included)
 * @return 1 for a lone card, 0 for an empty sequence
 */
int trailing_pair_length(const std::vector<Card>& sequence);

/**
 * @brief Length of the longest trailing run in a pegging sequence.
 * @param sequence Cards in play order (last card included)
 * @return k >= 3 when the last k cards form a run, otherwise 0
 */
int trailing_run_length(const std::vector<Card>& sequence);

} // namespace cribbage
