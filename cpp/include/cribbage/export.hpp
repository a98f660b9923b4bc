/**
 * @file export.hpp
 * @brief CSV export of game summaries and per-deal hand details.
 *
 * Summary columns (one row per game):
 * @code
 *   game_number, winner, player1_final_score, player2_final_score,
 *   hands_played, player1_play_points, player1_count_points,
 *   player1_heels_points, player2_play_points, player2_count_points,
 *   player2_heels_points, random_seed
 * @endcode
 *
 * Hand columns (one row per deal): game/hand number, dealer, for each
 * player dealt/kept/discarded cards, hand score, the five count categories
 * and score before/after, then the crib, starter and heels flag. Card lists
 * are written as comma separated strings inside quotes.
 *
 * Both exporters write the header when constructed and flush each row.
 */

#pragma once

#include "game.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief Quote a CSV field if it contains a comma, quote or newline.
 * @param field Raw text
 * @return Field safe to write between commas
 */
std::string csv_escape(const std::string& field);

/**
 * @brief Join fields into one CSV line (no trailing newline).
 */
std::string csv_join(const std::vector<std::string>& fields);

/** @brief Column names of the game summary CSV */
const std::vector<std::string>& summary_fieldnames();

/** @brief Column names of the hand details CSV */
const std::vector<std::string>& hand_fieldnames();

/**
 * @brief Fields of one game summary row, in summary_fieldnames() order.
 *
 * random_seed is empty when the seed was not tracked.
 */
std::vector<std::string> summary_row(const GameSummary& summary);

/**
 * @brief Fields of one hand details row, in hand_fieldnames() order.
 *
 * Hands that were not counted because the game ended first have empty
 * score columns.
 */
std::vector<std::string> hand_row(const DealRecord& record);

/**
 * @brief Writes one row per completed game.
 */
class CsvSummaryExporter : public GameObserver {
public:
    /**
     * @param path Output file (truncated)
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit CsvSummaryExporter(const std::string& path);

    void on_game_complete(const GameSummary& summary) override;

    /** @brief Rows written so far */
    int rows() const { return rows_; }

private:
    std::ofstream out_;
    int rows_;
};

/**
 * @brief Writes one row per deal.
 */
class CsvHandExporter : public GameObserver {
public:
    /**
     * @param path Output file (truncated)
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit CsvHandExporter(const std::string& path);

    void on_deal_complete(const DealRecord& record) override;

    /** @brief Rows written so far */
    int rows() const { return rows_; }

private:
    std::ofstream out_;
    int rows_;
};

} // namespace cribbage
