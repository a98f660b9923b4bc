#include <gtest/gtest.h>
#include "cribbage/scoring.hpp"

using namespace cribbage;

TEST(ScoringTest, PerfectHand) {
    // 5♠ 5♣ 5♦ J♥ + 5♥
    // fifteens: four 5-5-5 + four 5-J = 16, pairs: six = 12, nobs: 1
    ScoreBreakdown b = score_hand(parse_cards("5S 5C 5D JH"), parse_card("5H"));
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 16);
    EXPECT_EQ(b.get(ScoreCategory::PAIRS), 12);
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 0);
    EXPECT_EQ(b.get(ScoreCategory::FLUSH), 0);
    EXPECT_EQ(b.get(ScoreCategory::NOBS), 1);
    EXPECT_EQ(b.total(), 29);
}

TEST(ScoringTest, ZeroHand) {
    // All even values, no adjacent ranks: nothing scores
    ScoreBreakdown b = score_hand(parse_cards("2C 4D 6H 8S"), parse_card("KC"));
    EXPECT_EQ(b.total(), 0);
    EXPECT_TRUE(b.empty());
    EXPECT_TRUE(b.to_map().empty());
}

TEST(ScoringTest, RunOfFive) {
    // A 2 3 4 5: one fifteen (all five) and a run of five
    ScoreBreakdown b = score_hand(parse_cards("AC 2D 3H 4S"), parse_card("5C"));
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 2);
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 5);
    EXPECT_EQ(b.total(), 7);
}

TEST(ScoringTest, DoubleRun) {
    // 3 3 4 5 + 9: run 3-4-5 twice, one pair, 3+3+9 and 3+3+4+5
    ScoreBreakdown b = score_hand(parse_cards("3C 3D 4H 5S"), parse_card("9C"));
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 6);
    EXPECT_EQ(b.get(ScoreCategory::PAIRS), 2);
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 4);
    EXPECT_EQ(b.total(), 12);
}

TEST(ScoringTest, DoubleRunOfFour) {
    // 4 5 5 6 + 7: the starter extends the run, so 4-5-6-7 counts twice
    ScoreBreakdown b = score_hand(parse_cards("4C 5D 5H 6S"), parse_card("7C"));
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 8);
    EXPECT_EQ(b.get(ScoreCategory::PAIRS), 2);
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 4);
    EXPECT_EQ(b.total(), 14);
}

TEST(ScoringTest, TripleRun) {
    // 3 3 3 4 5: run of three, three ways
    ScoreBreakdown b = score_hand(parse_cards("3C 3D 3H 4S"), parse_card("5C"));
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 9);
    EXPECT_EQ(b.get(ScoreCategory::PAIRS), 6);
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 6);
    EXPECT_EQ(b.total(), 21);
}

TEST(ScoringTest, DoubleDoubleRun) {
    // 3 3 4 4 5: run of three, four ways
    ScoreBreakdown b = score_hand(parse_cards("3C 3D 4H 4S"), parse_card("5C"));
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 12);
    EXPECT_EQ(b.get(ScoreCategory::PAIRS), 4);
}

TEST(ScoringTest, RunsDoNotWrap) {
    // Q K A 2 is not a run
    ScoreBreakdown b = score_hand(parse_cards("QC KD AH 2S"), parse_card("7C"));
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 0);
}

TEST(ScoringTest, FaceCardsCountTen) {
    // K+5, Q+5, J+5 and 10+5 are all fifteens; 10-J-Q-K is a run of four
    ScoreBreakdown b = score_hand(parse_cards("10C JD QH KS"), parse_card("5C"));
    EXPECT_EQ(b.get(ScoreCategory::FIFTEENS), 8);
    EXPECT_EQ(b.get(ScoreCategory::RUNS), 4);
}

TEST(ScoringTest, Flush) {
    Hand suited = parse_cards("2H 4H 8H QH");

    // Four-card flush counts in the hand only
    EXPECT_EQ(score_hand(suited, parse_card("KS"), false).get(ScoreCategory::FLUSH), 4);
    EXPECT_EQ(score_hand(suited, parse_card("KS"), true).get(ScoreCategory::FLUSH), 0);

    // Five-card flush counts in both
    EXPECT_EQ(score_hand(suited, parse_card("6H"), false).get(ScoreCategory::FLUSH), 5);
    EXPECT_EQ(score_hand(suited, parse_card("6H"), true).get(ScoreCategory::FLUSH), 5);

    // Starter alone cannot make a flush
    Hand mixed = parse_cards("2H 4H 8H QS");
    EXPECT_EQ(score_hand(mixed, parse_card("6H")).get(ScoreCategory::FLUSH), 0);
}

TEST(ScoringTest, Nobs) {
    Hand hand = parse_cards("JH 2C 4D 9S");
    EXPECT_EQ(score_hand(hand, parse_card("KH")).get(ScoreCategory::NOBS), 1);
    EXPECT_EQ(score_hand(hand, parse_card("KC")).get(ScoreCategory::NOBS), 0);
}

TEST(ScoringTest, CategoryFunctions) {
    EXPECT_EQ(score_fifteens(parse_cards("5C KD")), 2);
    EXPECT_EQ(score_fifteens(parse_cards("5C")), 0);
    EXPECT_EQ(score_pairs(parse_cards("7C 7D 7H 7S")), 12);
    EXPECT_EQ(score_runs(parse_cards("2C 3D 4H 9S JC")), 3);
    EXPECT_EQ(score_runs(parse_cards("2C 3D 5H 6S")), 0);
}

TEST(ScoringTest, RejectsBadInput) {
    EXPECT_THROW(score_hand(parse_cards("2C 3D 4H"), parse_card("5S")), std::invalid_argument);
    EXPECT_THROW(score_hand(parse_cards("2C 3D 4H 5S 6C"), parse_card("7S")),
                 std::invalid_argument);
    EXPECT_THROW(score_hand(parse_cards("2C 2C 4H 5S"), parse_card("7S")), std::invalid_argument);
    EXPECT_THROW(score_hand(parse_cards("2C 3D 4H 5S"), parse_card("5S")), std::invalid_argument);

    Hand invalid = {parse_card("2C"), parse_card("3D"), parse_card("4H"), 60};
    EXPECT_THROW(score_hand(invalid, parse_card("7S")), std::invalid_argument);
}

TEST(ScoringTest, CategoryFunctionsRejectBadCards) {
    // Codes 52 and up are not cards
    std::vector<Card> invalid = {0, 60};
    EXPECT_THROW(score_pairs(invalid), std::invalid_argument);
    EXPECT_THROW(score_runs(invalid), std::invalid_argument);
    EXPECT_THROW(score_fifteens(invalid), std::invalid_argument);

    std::vector<Card> high = {parse_card("KS"), 255};
    EXPECT_THROW(score_pairs(high), std::invalid_argument);
    EXPECT_THROW(score_runs(high), std::invalid_argument);

    // The same card twice is not a pair
    EXPECT_THROW(score_pairs(parse_cards("7C 7C")), std::invalid_argument);
    EXPECT_THROW(score_runs(parse_cards("2C 3D 3D 4H")), std::invalid_argument);
    EXPECT_THROW(score_fifteens(parse_cards("5C 5C KD")), std::invalid_argument);
    EXPECT_THROW(score_fifteens(parse_cards("AC 2C 3C 4C 5C 6C")), std::invalid_argument);

    EXPECT_THROW(score_flush(parse_cards("2H 4H 8H QH"), 52, false), std::invalid_argument);
    EXPECT_THROW(score_flush(parse_cards("2H 4H 8H QH"), parse_card("QH"), false),
                 std::invalid_argument);
    EXPECT_THROW(score_nobs(parse_cards("JH 2C 4D 9S"), parse_card("JH")), std::invalid_argument);
    EXPECT_THROW(score_nobs({parse_card("JH"), 99}, parse_card("KH")), std::invalid_argument);
}

TEST(ScoringTest, Idempotent) {
    Hand hand = parse_cards("4C 5D 5H 6S");
    Hand copy = hand;
    ScoreBreakdown first = score_hand(hand, parse_card("7C"));
    ScoreBreakdown second = score_hand(hand, parse_card("7C"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(hand, copy);
}

TEST(ScoringTest, BreakdownHelpers) {
    ScoreBreakdown b = score_hand(parse_cards("AC 2D 3H 4S"), parse_card("5C"));
    std::map<std::string, int> m = b.to_map();
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m["fifteens"], 2);
    EXPECT_EQ(m["runs"], 5);
    EXPECT_EQ(b.describe(), "fifteens 2, runs 5");

    ScoreBreakdown sum;
    sum += b;
    sum += b;
    EXPECT_EQ(sum.total(), 14);
    EXPECT_NE(sum, b);

    EXPECT_STREQ(category_name(ScoreCategory::PLAY_THIRTY_ONE), "play-thirty-one");
    EXPECT_TRUE(is_count_category(ScoreCategory::NOBS));
    EXPECT_FALSE(is_count_category(ScoreCategory::PLAY_GO));
    EXPECT_FALSE(is_count_category(ScoreCategory::HEELS));
}
