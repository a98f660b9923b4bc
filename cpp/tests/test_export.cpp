#include <gtest/gtest.h>
#include "cribbage/export.hpp"
#include "cribbage/game_log.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace cribbage;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::unique_ptr<Strategy> random_strategy() {
    return std::unique_ptr<Strategy>(new RandomStrategy());
}

GameSummary sample_summary() {
    GameSummary s;
    s.game_id = 4;
    s.winner = 1;
    s.names = {{"Player 1", "Player 2"}};
    s.final_scores = {{97, 122}};
    s.play_points = {{30, 41}};
    s.count_points = {{67, 79}};
    s.heels_points = {{0, 2}};
    s.hands_played = 9;
    s.seed = 555;
    s.seed_tracked = true;
    return s;
}

} // namespace

TEST(ExportTest, CsvEscape) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("5♥,J♠"), "\"5♥,J♠\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csv_join({"a", "b,c", ""}), "a,\"b,c\",");
}

TEST(ExportTest, SummaryRow) {
    const std::vector<std::string>& names = summary_fieldnames();
    ASSERT_EQ(names.size(), 12u);
    EXPECT_EQ(names.front(), "game_number");
    EXPECT_EQ(names.back(), "random_seed");

    GameSummary s = sample_summary();
    std::vector<std::string> row = summary_row(s);
    ASSERT_EQ(row.size(), names.size());
    EXPECT_EQ(row[0], "4");
    EXPECT_EQ(row[1], "Player 2");
    EXPECT_EQ(row[2], "97");
    EXPECT_EQ(row[3], "122");
    EXPECT_EQ(row[4], "9");
    EXPECT_EQ(row[10], "2");
    EXPECT_EQ(row[11], "555");

    s.seed_tracked = false;
    EXPECT_EQ(summary_row(s)[11], "");
}

TEST(ExportTest, HandRowMatchesHeader) {
    const std::vector<std::string>& names = hand_fieldnames();
    EXPECT_EQ(names.size(), 34u);
    EXPECT_EQ(names[3], "p1_dealt_cards");
    EXPECT_EQ(names[7], "p1_hand_fifteens");
    EXPECT_EQ(names.back(), "his_heels");

    Game game(GameConfig(), random_strategy(), random_strategy());
    const DealRecord& deal = game.play_deal();
    std::vector<std::string> row = hand_row(deal);
    ASSERT_EQ(row.size(), names.size());

    EXPECT_EQ(row[0], "1");
    EXPECT_EQ(row[1], "1");
    EXPECT_EQ(row[2], deal.players[deal.dealer].name);
    EXPECT_EQ(row[3], cards_to_string(deal.players[0].dealt));
    EXPECT_EQ(row[6], std::to_string(deal.players[0].hand_breakdown.total()));
    EXPECT_EQ(row[names.size() - 2], card_to_string(deal.starter));
    EXPECT_EQ(row.back(), deal.his_heels ? "True" : "False");
}

TEST(ExportTest, UncountedHandsLeaveScoresBlank) {
    DealRecord record;
    record.game_id = 2;
    record.hand_id = 12;
    record.dealer = 0;
    record.players[0].name = "Player 1";
    record.players[1].name = "Player 2";
    record.players[1].hand_counted = true;
    record.players[1].hand_breakdown.add(ScoreCategory::FIFTEENS, 6);
    record.game_over = true;
    record.winner = 1;

    std::vector<std::string> row = hand_row(record);
    const std::vector<std::string>& names = hand_fieldnames();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == "p1_hand_score" || names[i] == "crib_score" || names[i] == "crib_runs") {
            EXPECT_EQ(row[i], "") << names[i];
        }
        if (names[i] == "p2_hand_score" || names[i] == "p2_hand_fifteens") {
            EXPECT_EQ(row[i], "6") << names[i];
        }
    }
}

TEST(ExportTest, ExportersWriteFiles) {
    std::string summary_path = ::testing::TempDir() + "cribbage_summary_test.csv";
    std::string hands_path = ::testing::TempDir() + "cribbage_hands_test.csv";

    int deals = 0;
    {
        CsvSummaryExporter summary_csv(summary_path);
        CsvHandExporter hands_csv(hands_path);

        for (int id = 1; id <= 3; ++id) {
            GameConfig config;
            config.seed = 100 + id;
            config.game_id = id;
            Game game(config, random_strategy(), random_strategy());
            game.add_observer(&summary_csv);
            game.add_observer(&hands_csv);
            deals += game.play_game().hands_played;
        }

        EXPECT_EQ(summary_csv.rows(), 3);
        EXPECT_EQ(hands_csv.rows(), deals);
    }

    std::vector<std::string> summary_lines = read_lines(summary_path);
    ASSERT_EQ(summary_lines.size(), 4u);
    EXPECT_EQ(summary_lines[0], csv_join(summary_fieldnames()));
    EXPECT_EQ(summary_lines[1].substr(0, 2), "1,");

    std::vector<std::string> hand_lines = read_lines(hands_path);
    ASSERT_EQ(hand_lines.size(), static_cast<size_t>(deals) + 1);
    EXPECT_EQ(hand_lines[0], csv_join(hand_fieldnames()));

    std::remove(summary_path.c_str());
    std::remove(hands_path.c_str());
}

TEST(ExportTest, UnwritablePathThrows) {
    EXPECT_THROW(CsvSummaryExporter exporter("/nonexistent-dir/summary.csv"), std::runtime_error);
    EXPECT_THROW(CsvHandExporter exporter("/nonexistent-dir/hands.csv"), std::runtime_error);
}

TEST(GameLogTest, VerbosityLevels) {
    std::ostringstream silent_out;
    std::ostringstream normal_out;
    std::ostringstream detailed_out;
    GameLogger silent(silent_out, 0);
    GameLogger normal(normal_out, 1);
    GameLogger detailed(detailed_out, 2);

    GameConfig config;
    config.seed = 77;
    Game game(config, random_strategy(), random_strategy());
    game.add_observer(&silent);
    game.add_observer(&normal);
    game.add_observer(&detailed);
    game.play_game();

    EXPECT_TRUE(silent_out.str().empty());

    std::string normal_text = normal_out.str();
    EXPECT_NE(normal_text.find("Scores:"), std::string::npos);
    EXPECT_EQ(normal_text.find("Starter card:"), std::string::npos);

    std::string detailed_text = detailed_out.str();
    EXPECT_NE(detailed_text.find("Starter card:"), std::string::npos);
    EXPECT_NE(detailed_text.find("Play phase (pegging)..."), std::string::npos);
    EXPECT_EQ(detailed_text.find(" dealt: "), std::string::npos);
    EXPECT_GT(detailed_text.size(), normal_text.size());
}

TEST(GameLogTest, DebugAddsHandsAndSinks) {
    std::ostringstream out;
    std::ostringstream copy;
    GameLogger logger(out, 0, true);
    logger.add_sink(copy);

    GameConfig config;
    config.seed = 78;
    Game game(config, random_strategy(), random_strategy());
    game.add_observer(&logger);
    game.play_deal();

    EXPECT_NE(out.str().find(" dealt: "), std::string::npos);
    EXPECT_NE(out.str().find(" discarded: "), std::string::npos);
    EXPECT_EQ(out.str(), copy.str());

    logger.log("only in debug", 5, true);
    EXPECT_NE(copy.str().find("only in debug"), std::string::npos);
}
