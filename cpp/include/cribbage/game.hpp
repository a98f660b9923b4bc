/**
 * @file game.hpp
 * @brief Two-player cribbage game state machine and its records.
 *
 * Each deal passes through the phases:
 * @code
 *   DEAL -> DISCARD -> CUT -> PLAY -> COUNT -> DEAL ... -> GAME_OVER
 * @endcode
 *
 * Game Rules:
 *   - Dealer alternates every deal; the first dealer is drawn from the seed
 *   - Cards are dealt one at a time, non-dealer first, until both hold 6
 *   - A Jack starter gives the dealer 2 ("heels") before play begins
 *   - Non-dealer leads the play; the count never exceeds 31
 *   - Counting order: non-dealer hand, dealer hand, dealer crib
 *   - The game ends the instant any score reaches 121, even mid-count
 *
 * Determinism: one 64-bit seed per game. The deck engine and the strategy
 * engine are both derived from it and never shared, so the same seed and
 * strategies always replay the same game.
 *
 * Observers receive one immutable DealRecord per deal (including a deal
 * cut short by a win) and one GameSummary when the game ends. They run
 * after the phase work is done and cannot change game state.
 */

#pragma once

#include "card.hpp"
#include "scoring.hpp"
#include "strategy.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace cribbage {

/** @brief Number of seats (two-player cribbage only) */
constexpr int NUM_PLAYERS = 2;

/** @brief Game phases in cyclic order */
enum class Phase {
    DEAL = 0,
    DISCARD,
    CUT,
    PLAY,
    COUNT,
    GAME_OVER
};

/** @brief Display name of a phase ("Deal", "Discard", ...) */
const char* phase_name(Phase phase);

/** @brief Outcome of one pegging turn */
enum class TurnAction {
    PLAYED = 0, ///< A card was played
    GO,         ///< Holds cards but none fits under 31
    EXHAUSTED   ///< No cards left to play this deal
};

/** @brief Display name of a turn action ("played", "go", "exhausted") */
const char* turn_action_name(TurnAction action);

/**
 * @brief One entry of the pegging audit log.
 *
 * For PLAYED the breakdown is what the card scored for player. For GO and
 * EXHAUSTED the breakdown is empty unless this turn ended the cycle, in
 * which case it holds the play-go point credited to scorer.
 */
struct PeggingEvent {
    int player;               ///< Seat whose turn it was
    TurnAction action;        ///< What the seat did
    Card card;                ///< Card played (PLAYED only)
    int count;                ///< Running count after the turn
    int scorer;               ///< Seat credited with breakdown, -1 if none
    ScoreBreakdown breakdown; ///< Points awarded on this turn
    bool cycle_reset;         ///< True if the count went back to 0 after this turn

    PeggingEvent()
        : player(0), action(TurnAction::PLAYED), card(0), count(0), scorer(-1),
          cycle_reset(false) {}
};

/**
 * @brief Scores and cards of one seat.
 *
 * The hand fields are scratch state for the current deal and are cleared
 * at the next DEAL.
 */
struct PlayerState {
    std::string name;             ///< Display name
    int score;                    ///< Cumulative score
    int play_points;              ///< Pegging points this game
    int count_points;             ///< Hand and crib points this game
    int heels_points;             ///< Heels points this game (as dealer)

    Hand hand;                    ///< Current holding (6 then 4)
    Hand dealt;                   ///< The 6 cards dealt this deal
    std::vector<Card> discards;   ///< The 2 cards given to the crib
    Hand kept;                    ///< The 4 cards kept for counting
    Hand play_hand;               ///< Kept cards not yet played in pegging

    PlayerState() : score(0), play_points(0), count_points(0), heels_points(0) {}
};

/** @brief Per-seat part of a DealRecord */
struct PlayerDealRecord {
    std::string name;             ///< Player name
    Hand dealt;                   ///< 6 dealt cards
    Hand kept;                    ///< 4 kept cards
    std::vector<Card> discards;   ///< 2 discarded cards
    ScoreBreakdown hand_breakdown;///< Count-phase score of the kept hand
    bool hand_counted;            ///< False if the game ended before this hand was counted
    int score_before;             ///< Score when counting began
    int score_after;              ///< Score when the deal ended

    PlayerDealRecord() : hand_counted(false), score_before(0), score_after(0) {}
};

/**
 * @brief Immutable summary of one deal, built once when the deal ends.
 */
struct DealRecord {
    int game_id;                  ///< Game number within the simulation
    int hand_id;                  ///< Deal number within the game (1-based)
    int dealer;                   ///< Dealer seat
    std::array<PlayerDealRecord, NUM_PLAYERS> players;
    Crib crib;                    ///< The 4 crib cards
    ScoreBreakdown crib_breakdown;///< Count-phase score of the crib
    bool crib_counted;            ///< False if the game ended first
    Card starter;                 ///< Cut card
    bool his_heels;               ///< Starter was a Jack
    std::vector<PeggingEvent> pegging; ///< Every pegging turn in order
    bool game_over;               ///< The game ended during this deal
    int winner;                   ///< Winning seat if game_over, else -1

    DealRecord()
        : game_id(0), hand_id(0), dealer(0), crib_counted(false), starter(0),
          his_heels(false), game_over(false), winner(-1) {}
};

/**
 * @brief Result of a completed game.
 */
struct GameSummary {
    int game_id;                  ///< Game number within the simulation
    int winner;                   ///< Winning seat
    std::array<std::string, NUM_PLAYERS> names;
    std::array<int, NUM_PLAYERS> final_scores;
    std::array<int, NUM_PLAYERS> play_points;
    std::array<int, NUM_PLAYERS> count_points;
    std::array<int, NUM_PLAYERS> heels_points;
    int hands_played;             ///< Deals started, including the last
    uint64_t seed;                ///< Seed the game was played with
    bool seed_tracked;            ///< False if the seed should not be reported

    GameSummary()
        : game_id(0), winner(-1), final_scores{}, play_points{}, count_points{},
          heels_points{}, hands_played(0), seed(0), seed_tracked(false) {}

    /** @brief Name of the winner, empty if unfinished */
    std::string winner_name() const { return winner >= 0 ? names[winner] : std::string(); }
};

bool operator==(const GameSummary& a, const GameSummary& b);

/**
 * @brief Receives records from a Game. Default implementations ignore them.
 */
class GameObserver {
public:
    virtual ~GameObserver() = default;

    /** @brief Called once per deal after its last phase (or the winning score) */
    virtual void on_deal_complete(const DealRecord& record) { (void)record; }

    /** @brief Called once when the game ends */
    virtual void on_game_complete(const GameSummary& summary) { (void)summary; }
};

/**
 * @brief Settings for a single game.
 */
struct GameConfig {
    std::string player1_name;     ///< Seat 0 name
    std::string player2_name;     ///< Seat 1 name
    uint64_t seed;                ///< Seed for deck and strategy engines
    int game_id;                  ///< Game number used in records
    bool track_seed;              ///< Report the seed in the summary
    int first_dealer;             ///< 0 or 1, or -1 to draw from the seed

    GameConfig()
        : player1_name("Player 1"), player2_name("Player 2"), seed(0), game_id(1),
          track_seed(true), first_dealer(-1) {}
};

/**
 * @brief Plays one game of two-player cribbage.
 *
 * Lifecycle:
 *   1. Construct with a config and one Strategy per seat
 *   2. Drive with step() (one phase), play_deal() (one deal) or play_game()
 *   3. Read summary() once is_over()
 *
 * Thread Safety: Not thread-safe. Separate Game instances share nothing and
 * can run on separate threads.
 */
class Game {
public:
    /**
     * @brief Set up a game in the DEAL phase.
     * @param config Names, seed and ids
     * @param seat0 Strategy for seat 0 (must not be null)
     * @param seat1 Strategy for seat 1 (must not be null)
     * @throws std::invalid_argument on a null strategy or bad first_dealer
     */
    Game(const GameConfig& config, std::unique_ptr<Strategy> seat0,
         std::unique_ptr<Strategy> seat1);

    /**
     * @brief Register a non-owning observer.
     * @param observer Must outlive the game
     */
    void add_observer(GameObserver* observer);

    /**
     * @brief Execute the current phase and advance.
     * @return The phase the game is now in
     * @throws PolicyError if a strategy breaks its contract
     *
     * A no-op once the game is over.
     */
    Phase step();

    /**
     * @brief Run phases until the current deal ends.
     * @return Record of the deal just played
     * @throws std::logic_error if the game is already over
     */
    const DealRecord& play_deal();

    /**
     * @brief Run the game to 121.
     * @return Final summary
     */
    const GameSummary& play_game();

    /** @brief Phase to be executed by the next step() */
    Phase phase() const { return phase_; }

    /** @brief True once someone has reached 121 */
    bool is_over() const { return phase_ == Phase::GAME_OVER; }

    /** @brief Winning seat, or -1 while the game is running */
    int winner() const { return winner_; }

    /** @brief Current dealer seat */
    int dealer() const { return dealer_; }

    /** @brief Deals started so far */
    int hands_played() const { return hands_played_; }

    /** @brief Seat state (read-only) */
    const PlayerState& player(int seat) const { return players_.at(seat); }

    /** @brief Strategy bound to a seat (read-only) */
    const Strategy& strategy(int seat) const { return *strategies_.at(seat); }

    /** @brief Crib of the current deal */
    const Crib& crib() const { return crib_; }

    /** @brief Starter of the current deal; only meaningful after CUT */
    Card starter() const { return starter_; }

    /** @brief Cards in the current pegging cycle */
    const std::vector<Card>& pegging_sequence() const { return cycle_; }

    /** @brief Running count of the current pegging cycle */
    int pegging_count() const { return count_; }

    /** @brief Record of the most recently finished deal */
    const DealRecord& last_deal() const { return last_deal_; }

    /** @brief Final summary; valid once is_over() */
    const GameSummary& summary() const { return summary_; }

    /** @brief Seed this game was created with */
    uint64_t seed() const { return config_.seed; }

private:
    void deal_cards();
    void discard_phase();
    void cut_starter();
    void play_phase();
    void count_phase();

    /**
     * @brief One pegging turn for a seat.
     * @return PLAYED, GO or EXHAUSTED
     */
    TurnAction take_turn(int seat);

    /** @brief Clear the pegging cycle back to count 0 */
    void reset_cycle();

    /**
     * @brief Credit a breakdown to a seat and check for the win.
     * @return True if this award ended the game
     */
    bool award(int seat, const ScoreBreakdown& breakdown);

    /** @brief Build the DealRecord, notify observers, and finish the game if won */
    void finish_deal();
    void finish_game();

    GameConfig config_;
    std::array<std::unique_ptr<Strategy>, NUM_PLAYERS> strategies_;
    std::vector<GameObserver*> observers_;

    std::mt19937_64 deck_rng_;    ///< Shuffles and first-dealer draw
    std::mt19937_64 policy_rng_;  ///< Strategy decisions only

    Deck deck_;
    std::array<PlayerState, NUM_PLAYERS> players_;
    Crib crib_;
    Card starter_;
    bool his_heels_;

    // Pegging cycle
    std::vector<Card> cycle_;
    int count_;
    int last_player_;             ///< Last seat to play in the cycle, -1 if none
    std::vector<PeggingEvent> pegging_log_;

    // Count phase
    std::array<int, NUM_PLAYERS> score_before_count_;
    std::array<ScoreBreakdown, NUM_PLAYERS> hand_breakdowns_;
    std::array<bool, NUM_PLAYERS> hand_counted_;
    ScoreBreakdown crib_breakdown_;
    bool crib_counted_;

    Phase phase_;
    int dealer_;
    int winner_;
    int hands_played_;

    DealRecord last_deal_;
    GameSummary summary_;
};

} // namespace cribbage
