#include <gtest/gtest.h>
#include "cribbage/export.hpp"
#include "cribbage/game.hpp"
#include "cribbage/rules.hpp"

using namespace cribbage;

namespace {

class DealCollector : public GameObserver {
public:
    void on_deal_complete(const DealRecord& record) override { deals.push_back(record); }
    void on_game_complete(const GameSummary& summary) override { summaries.push_back(summary); }
    std::vector<DealRecord> deals;
    std::vector<GameSummary> summaries;
};

// Discards the same card twice
class DoubleDiscardStrategy : public Strategy {
public:
    std::vector<Card> choose_discards(const Hand& hand, bool, std::mt19937_64&) override {
        return {hand[0], hand[0]};
    }
    Card choose_play(const Hand& hand, int, const std::vector<Card>&, std::mt19937_64&) override {
        return hand[0];
    }
    std::string name() const override { return "double-discard"; }
};

// Plays a card it does not hold
class PhantomCardStrategy : public Strategy {
public:
    std::vector<Card> choose_discards(const Hand& hand, bool, std::mt19937_64&) override {
        return {hand[0], hand[1]};
    }
    Card choose_play(const Hand& hand, int, const std::vector<Card>&, std::mt19937_64&) override {
        for (int i = 0; i < DECK_SIZE; ++i) {
            if (!holds_card(hand, static_cast<Card>(i))) return static_cast<Card>(i);
        }
        return hand[0];
    }
    std::string name() const override { return "phantom"; }
};

// Always plays its highest card, legal or not
class GreedyOverflowStrategy : public Strategy {
public:
    std::vector<Card> choose_discards(const Hand& hand, bool, std::mt19937_64&) override {
        return {hand[0], hand[1]};
    }
    Card choose_play(const Hand& hand, int, const std::vector<Card>&, std::mt19937_64&) override {
        Card best = hand[0];
        for (Card c : hand) {
            if (count_value(c) > count_value(best)) best = c;
        }
        return best;
    }
    std::string name() const override { return "greedy-overflow"; }
};

std::unique_ptr<Strategy> random_strategy() {
    return std::unique_ptr<Strategy>(new RandomStrategy());
}

GameConfig seeded(uint64_t seed) {
    GameConfig config;
    config.seed = seed;
    return config;
}

} // namespace

TEST(GameTest, RejectsBadSetup) {
    EXPECT_THROW(Game game(seeded(1), nullptr, random_strategy()), std::invalid_argument);

    GameConfig config = seeded(1);
    config.first_dealer = 2;
    EXPECT_THROW(Game game(config, random_strategy(), random_strategy()), std::invalid_argument);
}

TEST(GameTest, PhaseSequence) {
    GameConfig config = seeded(5);
    config.first_dealer = 0;
    Game game(config, random_strategy(), random_strategy());

    EXPECT_EQ(game.phase(), Phase::DEAL);
    EXPECT_EQ(game.dealer(), 0);

    EXPECT_EQ(game.step(), Phase::DISCARD);
    EXPECT_EQ(game.hands_played(), 1);
    EXPECT_EQ(game.player(0).hand.size(), 6u);
    EXPECT_EQ(game.player(1).hand.size(), 6u);

    EXPECT_EQ(game.step(), Phase::CUT);
    EXPECT_EQ(game.player(0).kept.size(), 4u);
    EXPECT_EQ(game.player(1).kept.size(), 4u);
    EXPECT_EQ(game.crib().size(), 4u);

    EXPECT_EQ(game.step(), Phase::PLAY);
    EXPECT_TRUE(is_valid_card(game.starter()));

    // The first deal cannot reach 121, so the full cycle always runs
    EXPECT_EQ(game.step(), Phase::COUNT);
    EXPECT_TRUE(game.player(0).play_hand.empty());
    EXPECT_TRUE(game.player(1).play_hand.empty());
    EXPECT_EQ(game.pegging_count(), 0);

    EXPECT_EQ(game.step(), Phase::DEAL);
    EXPECT_EQ(game.dealer(), 1);
    EXPECT_EQ(game.last_deal().hand_id, 1);
    EXPECT_EQ(game.last_deal().dealer, 0);
}

TEST(GameTest, DealDrawsDistinctCards) {
    Game game(seeded(11), random_strategy(), random_strategy());
    const DealRecord& deal = game.play_deal();

    std::vector<Card> all(deal.players[0].dealt);
    all.insert(all.end(), deal.players[1].dealt.begin(), deal.players[1].dealt.end());
    all.push_back(deal.starter);
    EXPECT_EQ(all.size(), 13u);
    EXPECT_TRUE(all_unique(all));

    // Crib holds exactly the four discards
    for (const PlayerDealRecord& p : deal.players) {
        for (Card c : p.discards) {
            EXPECT_TRUE(holds_card(deal.crib, c));
        }
        EXPECT_EQ(p.kept.size(), 4u);
    }
}

TEST(GameTest, SameSeedSameGame) {
    for (uint64_t seed : {1ULL, 42ULL, 123456789ULL}) {
        DealCollector a;
        DealCollector b;
        Game game_a(seeded(seed), random_strategy(), random_strategy());
        Game game_b(seeded(seed), random_strategy(), random_strategy());
        game_a.add_observer(&a);
        game_b.add_observer(&b);

        EXPECT_EQ(game_a.play_game(), game_b.play_game());
        ASSERT_EQ(a.deals.size(), b.deals.size());
        for (size_t i = 0; i < a.deals.size(); ++i) {
            EXPECT_EQ(hand_row(a.deals[i]), hand_row(b.deals[i]));
        }
    }
}

TEST(GameTest, DifferentSeedsDiffer) {
    Game a(seeded(1), random_strategy(), random_strategy());
    Game b(seeded(2), random_strategy(), random_strategy());
    EXPECT_NE(hand_row(a.play_deal()), hand_row(b.play_deal()));
}

TEST(GameTest, PlaysToCompletion) {
    for (uint64_t seed = 1; seed <= 30; ++seed) {
        Game game(seeded(seed), random_strategy(), random_strategy());
        DealCollector collector;
        game.add_observer(&collector);
        const GameSummary& summary = game.play_game();

        EXPECT_TRUE(game.is_over());
        ASSERT_GE(summary.winner, 0);
        int loser = 1 - summary.winner;
        EXPECT_GE(summary.final_scores[summary.winner], WINNING_SCORE);
        EXPECT_LT(summary.final_scores[loser], WINNING_SCORE);

        for (int seat = 0; seat < NUM_PLAYERS; ++seat) {
            EXPECT_EQ(summary.final_scores[seat],
                      summary.play_points[seat] + summary.count_points[seat] +
                      summary.heels_points[seat]);
        }

        EXPECT_EQ(static_cast<int>(collector.deals.size()), summary.hands_played);
        ASSERT_EQ(collector.summaries.size(), 1u);
        EXPECT_EQ(collector.summaries[0], summary);
        EXPECT_TRUE(collector.deals.back().game_over);
        EXPECT_EQ(collector.deals.back().winner, summary.winner);

        // Stepping a finished game changes nothing
        EXPECT_EQ(game.step(), Phase::GAME_OVER);
        EXPECT_THROW(game.play_deal(), std::logic_error);
    }
}

TEST(GameTest, DealerAlternates) {
    Game game(seeded(8), random_strategy(), random_strategy());
    DealCollector collector;
    game.add_observer(&collector);
    game.play_game();

    for (size_t i = 1; i < collector.deals.size(); ++i) {
        EXPECT_EQ(collector.deals[i].dealer, 1 - collector.deals[i - 1].dealer);
        EXPECT_EQ(collector.deals[i].hand_id, static_cast<int>(i) + 1);
    }
}

TEST(GameTest, HeelsCreditsDealer) {
    int heels_deals = 0;
    for (uint64_t seed = 1; seed <= 40; ++seed) {
        Game game(seeded(seed), random_strategy(), random_strategy());
        DealCollector collector;
        game.add_observer(&collector);
        const GameSummary& summary = game.play_game();

        std::array<int, NUM_PLAYERS> heels = {0, 0};
        for (const DealRecord& deal : collector.deals) {
            EXPECT_EQ(deal.his_heels, get_rank(deal.starter) == RANK_JACK);
            if (deal.his_heels) {
                heels[deal.dealer] += HEELS_POINTS;
                ++heels_deals;
            }
        }
        EXPECT_EQ(heels[0], summary.heels_points[0]);
        EXPECT_EQ(heels[1], summary.heels_points[1]);
    }
    // About one deal in thirteen cuts a Jack
    EXPECT_GT(heels_deals, 0);
}

TEST(GameTest, CountingOrderAndScoreDeltas) {
    for (uint64_t seed = 1; seed <= 30; ++seed) {
        Game game(seeded(seed), random_strategy(), random_strategy());
        DealCollector collector;
        game.add_observer(&collector);
        game.play_game();

        for (const DealRecord& deal : collector.deals) {
            const PlayerDealRecord& pone = deal.players[1 - deal.dealer];
            const PlayerDealRecord& dealer = deal.players[deal.dealer];

            // Non-dealer, then dealer, then crib
            if (dealer.hand_counted) EXPECT_TRUE(pone.hand_counted);
            if (deal.crib_counted) EXPECT_TRUE(dealer.hand_counted);

            if (!deal.game_over) {
                EXPECT_TRUE(deal.crib_counted);
                EXPECT_EQ(pone.score_after - pone.score_before, pone.hand_breakdown.total());
                EXPECT_EQ(dealer.score_after - dealer.score_before,
                          dealer.hand_breakdown.total() + deal.crib_breakdown.total());
                EXPECT_EQ(pone.hand_breakdown, score_hand(pone.kept, deal.starter, false));
                EXPECT_EQ(deal.crib_breakdown, score_hand(deal.crib, deal.starter, true));
            } else if (pone.hand_counted && !dealer.hand_counted) {
                // Game ended on the non-dealer's count
                EXPECT_EQ(deal.winner, 1 - deal.dealer);
            } else if (dealer.hand_counted && !deal.crib_counted) {
                EXPECT_EQ(deal.winner, deal.dealer);
            }
        }
    }
}

TEST(GameTest, PlayerNamesFlowIntoRecords) {
    GameConfig config = seeded(3);
    config.player1_name = "Alice";
    config.player2_name = "Bob";
    Game game(config, random_strategy(), random_strategy());
    const GameSummary& summary = game.play_game();

    EXPECT_EQ(summary.names[0], "Alice");
    EXPECT_EQ(summary.names[1], "Bob");
    EXPECT_TRUE(summary.winner_name() == "Alice" || summary.winner_name() == "Bob");
    EXPECT_EQ(game.last_deal().players[0].name, "Alice");
    EXPECT_EQ(summary.seed, 3u);
    EXPECT_TRUE(summary.seed_tracked);
}

TEST(GameTest, InvalidDiscardIsPolicyError) {
    Game game(seeded(1), std::unique_ptr<Strategy>(new DoubleDiscardStrategy()), random_strategy());
    game.step();
    EXPECT_THROW(game.step(), PolicyError);
}

TEST(GameTest, UnheldCardIsPolicyError) {
    Game game(seeded(1), std::unique_ptr<Strategy>(new PhantomCardStrategy()),
              std::unique_ptr<Strategy>(new PhantomCardStrategy()));
    game.step();
    game.step();
    game.step();
    EXPECT_THROW(game.step(), PolicyError);
}

TEST(GameTest, OverflowPlayIsPolicyError) {
    bool thrown = false;
    for (uint64_t seed = 1; seed <= 50 && !thrown; ++seed) {
        Game game(seeded(seed), std::unique_ptr<Strategy>(new GreedyOverflowStrategy()),
                  std::unique_ptr<Strategy>(new GreedyOverflowStrategy()));
        try {
            game.play_game();
        } catch (const PolicyError&) {
            thrown = true;
        }
    }
    EXPECT_TRUE(thrown);
}

TEST(GameTest, RandomStrategyContract) {
    RandomStrategy strategy;
    std::mt19937_64 rng(9);
    Hand hand = parse_cards("AC 2D 3H 4S 5C 6D");

    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(is_valid_discard(hand, strategy.choose_discards(hand, i % 2 == 0, rng)));
    }
    EXPECT_THROW(strategy.choose_discards(parse_cards("AC 2D 3H 4S 5C"), false, rng), PolicyError);

    // First legal in hand order
    Hand play_hand = parse_cards("KC 9D 2H");
    EXPECT_EQ(strategy.choose_play(play_hand, 25, {}, rng), parse_card("2H"));
    EXPECT_EQ(strategy.choose_play(play_hand, 0, {}, rng), parse_card("KC"));
    EXPECT_THROW(strategy.choose_play(play_hand, 30, {}, rng), PolicyError);

    RandomStrategy random_order(RandomStrategy::RANDOM_LEGAL);
    for (int i = 0; i < 20; ++i) {
        Card c = random_order.choose_play(play_hand, 21, {}, rng);
        EXPECT_TRUE(c == parse_card("KC") || c == parse_card("9D") || c == parse_card("2H"));
    }
}
