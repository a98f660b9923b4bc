/**
 * @file game_log.hpp
 * @brief Human-readable game log written from deal and game records.
 *
 * Verbosity levels:
 *   - 0: silent
 *   - 1: scoring events, hand/crib counts, game results
 *   - 2: also deal headers, starter, every pegging turn, count breakdowns
 *
 * Debug mode prints everything level 2 prints plus the dealt hands and
 * discards.
 */

#pragma once

#include "game.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief GameObserver that prints to one or more streams.
 */
class GameLogger : public GameObserver {
public:
    /**
     * @param out Primary stream (usually std::cout); must outlive the logger
     * @param verbosity 0, 1 or 2
     * @param debug Also print dealt hands and discards
     */
    GameLogger(std::ostream& out, int verbosity, bool debug = false);

    /** @brief Copy every logged line to another stream as well */
    void add_sink(std::ostream& out);

    void on_deal_complete(const DealRecord& record) override;
    void on_game_complete(const GameSummary& summary) override;

    /**
     * @brief Write one line if the level is enabled.
     * @param message Text without trailing newline
     * @param level Minimum verbosity required
     * @param debug_only Only written in debug mode
     */
    void log(const std::string& message, int level = 1, bool debug_only = false);

    int verbosity() const { return verbosity_; }
    bool debug() const { return debug_; }

private:
    void log_pegging(const DealRecord& record);
    void log_count(const PlayerDealRecord& player, const std::vector<Card>& cards,
                   const ScoreBreakdown& breakdown, Card starter, bool is_crib);

    std::vector<std::ostream*> sinks_;
    int verbosity_;
    bool debug_;
};

} // namespace cribbage
