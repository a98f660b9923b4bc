/**
 * @file game.cpp
 * @brief Implementation of the cribbage phase state machine.
 *
 * Key operations:
 *   - step(): run exactly one phase and move to the next
 *   - play_phase(): alternating pegging turns with go handling
 *   - count_phase(): hand, hand, crib with a win check after each
 *
 * Pegging turn protocol:
 *   1. A seat with a legal play must play; the strategy picks the card
 *   2. A seat without one passes (GO, or EXHAUSTED if out of cards)
 *   3. If the opponent can still play, the turn passes to them
 *   4. If nobody can play, the last seat to play gets play-go (1) and
 *      the cycle resets; a count of exactly 31 resets at once instead
 *   5. After any reset the opponent of the last seat to play leads
 */

#include "../include/cribbage/game.hpp"
#include "../include/cribbage/rules.hpp"
#include <stdexcept>

namespace cribbage {

const char* phase_name(Phase phase) {
    static const char* names[] = {"Deal", "Discard", "Cut", "Play", "Count", "Game Over"};
    return names[static_cast<int>(phase)];
}

const char* turn_action_name(TurnAction action) {
    static const char* names[] = {"played", "go", "exhausted"};
    return names[static_cast<int>(action)];
}

bool operator==(const GameSummary& a, const GameSummary& b) {
    return a.game_id == b.game_id && a.winner == b.winner && a.names == b.names &&
           a.final_scores == b.final_scores && a.play_points == b.play_points &&
           a.count_points == b.count_points && a.heels_points == b.heels_points &&
           a.hands_played == b.hands_played && a.seed == b.seed &&
           a.seed_tracked == b.seed_tracked;
}

Game::Game(const GameConfig& config, std::unique_ptr<Strategy> seat0,
           std::unique_ptr<Strategy> seat1)
    : config_(config), deck_rng_(config.seed), starter_(0), his_heels_(false),
      count_(0), last_player_(-1), score_before_count_{}, hand_counted_{},
      crib_counted_(false), phase_(Phase::DEAL), dealer_(0), winner_(-1),
      hands_played_(0) {
    if (!seat0 || !seat1) {
        throw std::invalid_argument("Game requires a strategy for both seats");
    }
    if (config.first_dealer < -1 || config.first_dealer >= NUM_PLAYERS) {
        throw std::invalid_argument("first_dealer must be -1, 0 or 1");
    }

    strategies_[0] = std::move(seat0);
    strategies_[1] = std::move(seat1);
    players_[0].name = config.player1_name;
    players_[1].name = config.player2_name;

    // Strategy stream is derived from the same seed but never shares state
    // with the deck stream
    std::seed_seq policy_seq{static_cast<uint32_t>(config.seed),
                             static_cast<uint32_t>(config.seed >> 32), 0x70u};
    policy_rng_.seed(policy_seq);

    if (config.first_dealer >= 0) {
        dealer_ = config.first_dealer;
    } else {
        std::uniform_int_distribution<int> coin(0, NUM_PLAYERS - 1);
        dealer_ = coin(deck_rng_);
    }
}

void Game::add_observer(GameObserver* observer) {
    if (observer) {
        observers_.push_back(observer);
    }
}

Phase Game::step() {
    switch (phase_) {
        case Phase::DEAL:
            deal_cards();
            phase_ = Phase::DISCARD;
            break;
        case Phase::DISCARD:
            discard_phase();
            phase_ = Phase::CUT;
            break;
        case Phase::CUT:
            cut_starter();
            phase_ = Phase::PLAY;
            break;
        case Phase::PLAY:
            play_phase();
            phase_ = Phase::COUNT;
            break;
        case Phase::COUNT:
            count_phase();
            finish_deal();
            if (winner_ < 0) {
                dealer_ = 1 - dealer_;
            }
            phase_ = Phase::DEAL;
            break;
        case Phase::GAME_OVER:
            return phase_;
    }

    // A win can come from heels, pegging or counting; stop right there
    if (winner_ >= 0 && phase_ != Phase::GAME_OVER) {
        if (phase_ != Phase::DEAL) {
            finish_deal();
        }
        finish_game();
    }
    return phase_;
}

const DealRecord& Game::play_deal() {
    if (is_over()) {
        throw std::logic_error("Game is already finished");
    }

    int deal = hands_played_;
    step();
    while (phase_ != Phase::GAME_OVER && !(phase_ == Phase::DEAL && hands_played_ > deal)) {
        step();
    }
    return last_deal_;
}

const GameSummary& Game::play_game() {
    while (phase_ != Phase::GAME_OVER) {
        step();
    }
    return summary_;
}

void Game::deal_cards() {
    ++hands_played_;

    deck_.reset();
    deck_.shuffle(deck_rng_);
    crib_.clear();
    starter_ = 0;
    his_heels_ = false;
    cycle_.clear();
    count_ = 0;
    last_player_ = -1;
    pegging_log_.clear();
    score_before_count_ = {};
    hand_breakdowns_ = {};
    hand_counted_ = {};
    crib_breakdown_ = ScoreBreakdown();
    crib_counted_ = false;

    for (PlayerState& p : players_) {
        p.hand.clear();
        p.dealt.clear();
        p.discards.clear();
        p.kept.clear();
        p.play_hand.clear();
    }

    // One card at a time, non-dealer first
    int non_dealer = 1 - dealer_;
    for (int i = 0; i < INITIAL_HAND_SIZE; ++i) {
        for (int offset = 0; offset < NUM_PLAYERS; ++offset) {
            PlayerState& p = players_[(non_dealer + offset) % NUM_PLAYERS];
            Card c = deck_.draw();
            p.hand.push_back(c);
            p.dealt.push_back(c);
        }
    }
}

void Game::discard_phase() {
    for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
        PlayerState& p = players_[seat];
        std::vector<Card> discards =
            strategies_[seat]->choose_discards(p.hand, seat == dealer_, policy_rng_);

        if (!is_valid_discard(p.hand, discards)) {
            throw PolicyError(strategies_[seat]->name() + " returned an invalid discard [" +
                              cards_to_string(discards) + "] from [" +
                              cards_to_string(p.hand) + "]");
        }

        remove_cards(p.hand, discards);
        p.discards = discards;
        p.kept = p.hand;
        p.play_hand = p.hand;
        crib_.insert(crib_.end(), discards.begin(), discards.end());
    }
}

void Game::cut_starter() {
    starter_ = deck_.draw();
    his_heels_ = check_his_heels(starter_);
    if (his_heels_) {
        ScoreBreakdown heels;
        heels.add(ScoreCategory::HEELS, HEELS_POINTS);
        award(dealer_, heels);
    }
}

void Game::reset_cycle() {
    cycle_.clear();
    count_ = 0;
}

TurnAction Game::take_turn(int seat) {
    PlayerState& p = players_[seat];

    PeggingEvent event;
    event.player = seat;

    if (!has_legal_play(p.play_hand, count_)) {
        event.action = p.play_hand.empty() ? TurnAction::EXHAUSTED : TurnAction::GO;
        event.count = count_;
        pegging_log_.push_back(event);
        return event.action;
    }

    Card card = strategies_[seat]->choose_play(p.play_hand, count_, cycle_, policy_rng_);
    if (!holds_card(p.play_hand, card)) {
        throw PolicyError(strategies_[seat]->name() + " played " + card_to_string(card) +
                          " which is not in hand [" + cards_to_string(p.play_hand) + "]");
    }
    if (!can_play_card(card, count_)) {
        throw PolicyError(strategies_[seat]->name() + " played " + card_to_string(card) +
                          " on a count of " + std::to_string(count_));
    }

    ScoreBreakdown breakdown = score_play(cycle_, card);
    remove_cards(p.play_hand, std::vector<Card>{card});
    cycle_.push_back(card);
    count_ += count_value(card);
    last_player_ = seat;

    event.action = TurnAction::PLAYED;
    event.card = card;
    event.count = count_;
    event.breakdown = breakdown;
    event.scorer = breakdown.empty() ? -1 : seat;
    event.cycle_reset = count_ == MAX_PLAY_COUNT;
    pegging_log_.push_back(event);

    award(seat, breakdown);
    return TurnAction::PLAYED;
}

void Game::play_phase() {
    int seat = 1 - dealer_;

    while (winner_ < 0) {
        bool cards_left = !players_[0].play_hand.empty() || !players_[1].play_hand.empty();
        if (!cards_left && cycle_.empty()) {
            break;
        }

        TurnAction action = take_turn(seat);
        if (winner_ >= 0) {
            break;
        }

        if (action == TurnAction::PLAYED) {
            // 31 resets at once; the play already scored play-thirty-one
            if (count_ == MAX_PLAY_COUNT) {
                reset_cycle();
            }
            seat = 1 - seat;
            continue;
        }

        int other = 1 - seat;
        if (has_legal_play(players_[other].play_hand, count_)) {
            seat = other;
            continue;
        }

        // Nobody can continue: go for the last card played below 31
        if (!cycle_.empty()) {
            ScoreBreakdown go;
            go.add(ScoreCategory::PLAY_GO, 1);
            PeggingEvent& event = pegging_log_.back();
            event.scorer = last_player_;
            event.breakdown = go;
            event.cycle_reset = true;
            award(last_player_, go);
        }
        reset_cycle();
        seat = last_player_ >= 0 ? 1 - last_player_ : 1 - dealer_;
    }
}

void Game::count_phase() {
    for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
        score_before_count_[seat] = players_[seat].score;
    }

    // Non-dealer counts first; each addition can end the game
    int non_dealer = 1 - dealer_;
    const int order[NUM_PLAYERS] = {non_dealer, dealer_};
    for (int seat : order) {
        hand_breakdowns_[seat] = score_hand(players_[seat].kept, starter_, false);
        hand_counted_[seat] = true;
        if (award(seat, hand_breakdowns_[seat])) {
            return;
        }
    }

    crib_breakdown_ = score_hand(crib_, starter_, true);
    crib_counted_ = true;
    award(dealer_, crib_breakdown_);
}

bool Game::award(int seat, const ScoreBreakdown& breakdown) {
    PlayerState& p = players_[seat];
    for (int i = 0; i < NUM_CATEGORIES; ++i) {
        int pts = breakdown.points[i];
        if (pts == 0) continue;

        ScoreCategory category = static_cast<ScoreCategory>(i);
        if (category == ScoreCategory::HEELS) {
            p.heels_points += pts;
        } else if (is_count_category(category)) {
            p.count_points += pts;
        } else {
            p.play_points += pts;
        }
    }
    p.score += breakdown.total();

    if (winner_ < 0 && is_game_won(p.score)) {
        winner_ = seat;
    }
    return winner_ == seat;
}

void Game::finish_deal() {
    DealRecord record;
    record.game_id = config_.game_id;
    record.hand_id = hands_played_;
    record.dealer = dealer_;
    record.crib = crib_;
    record.crib_breakdown = crib_breakdown_;
    record.crib_counted = crib_counted_;
    record.starter = starter_;
    record.his_heels = his_heels_;
    record.pegging = pegging_log_;
    record.game_over = winner_ >= 0;
    record.winner = winner_;

    bool count_started = crib_counted_ || hand_counted_[0] || hand_counted_[1];
    for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
        const PlayerState& p = players_[seat];
        PlayerDealRecord& r = record.players[seat];
        r.name = p.name;
        r.dealt = p.dealt;
        r.kept = p.kept;
        r.discards = p.discards;
        r.hand_breakdown = hand_breakdowns_[seat];
        r.hand_counted = hand_counted_[seat];
        r.score_before = count_started ? score_before_count_[seat] : p.score;
        r.score_after = p.score;
    }

    last_deal_ = record;
    for (GameObserver* observer : observers_) {
        observer->on_deal_complete(last_deal_);
    }
}

void Game::finish_game() {
    phase_ = Phase::GAME_OVER;

    summary_ = GameSummary();
    summary_.game_id = config_.game_id;
    summary_.winner = winner_;
    for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
        const PlayerState& p = players_[seat];
        summary_.names[seat] = p.name;
        summary_.final_scores[seat] = p.score;
        summary_.play_points[seat] = p.play_points;
        summary_.count_points[seat] = p.count_points;
        summary_.heels_points[seat] = p.heels_points;
    }
    summary_.hands_played = hands_played_;
    summary_.seed = config_.seed;
    summary_.seed_tracked = config_.track_seed;

    for (GameObserver* observer : observers_) {
        observer->on_game_complete(summary_);
    }
}

} // namespace cribbage
