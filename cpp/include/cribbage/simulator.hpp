/**
 * @file simulator.hpp
 * @brief Runs batches of independent cribbage games.
 *
 * Provides the main entry point for statistical runs, used by the CLI and
 * exposed to Python via pybind11.
 *
 * Key Features:
 *   - Per-game seeds drawn from one seed engine (base seed or random_device)
 *   - Optional fan-out across worker threads; every game is self-contained
 *   - Observers see records in game order regardless of thread count
 *   - replay() reproduces any game from its recorded seed
 *
 * Usage:
 * @code
 *   SimulationConfig config;
 *   config.n_games = 100;
 *   config.verbosity = 0;
 *   Simulator sim(config);
 *   SimulationResult result = sim.run();
 *   std::cout << result.wins[0] << " / " << result.wins[1] << std::endl;
 * @endcode
 */

#pragma once

#include "config.hpp"
#include "game.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace cribbage {

/**
 * @brief Aggregate outcome of a batch of games.
 */
struct SimulationResult {
    std::vector<GameSummary> games;     ///< One summary per game, in game order
    std::array<int, NUM_PLAYERS> wins;  ///< Games won per seat
    int total_hands;                    ///< Deals over all games

    SimulationResult() : wins{}, total_hands(0) {}

    /** @brief Mean deals per game, 0 for an empty batch */
    double average_hands() const {
        return games.empty() ? 0.0 : static_cast<double>(total_hands) / games.size();
    }

    /** @brief Percentage of games won by a seat */
    double win_rate(int seat) const {
        return games.empty() ? 0.0 : 100.0 * wins[seat] / games.size();
    }
};

/**
 * @brief Plays config.n_games games with the default RandomStrategy.
 *
 * Thread Safety: run() may use worker threads internally, but a Simulator
 * instance must only be driven from one thread.
 */
class Simulator {
public:
    /**
     * @param config Batch settings
     * @throws std::invalid_argument if config does not validate
     */
    explicit Simulator(const SimulationConfig& config);

    /**
     * @brief Register a non-owning observer for every game of the batch.
     * @param observer Must outlive run()
     */
    void add_observer(GameObserver* observer);

    /**
     * @brief Play the whole batch.
     * @return Summaries and aggregate counts
     * @throws PolicyError or std::out_of_range from a game, which aborts the run
     *
     * Games are numbered from 1. Seeds are fixed before any game starts.
     */
    SimulationResult run();

    /**
     * @brief Replay one game from its seed without notifying observers.
     * @param seed Seed reported in a GameSummary
     * @param game_id Game number to stamp on the summary
     * @return Summary identical to the first run of that game
     */
    GameSummary replay(uint64_t seed, int game_id = 1) const;

    /** @brief Per-game seeds of the last run(), in game order */
    const std::vector<uint64_t>& seeds() const { return seeds_; }

    /** @brief Base seed actually used by the last run() */
    uint64_t base_seed() const { return base_seed_; }

    const SimulationConfig& config() const { return config_; }

private:
    /** @brief Draw n_games seeds from the seed engine */
    void draw_seeds();

    /** @brief Build a game with two default strategies */
    Game make_game(uint64_t seed, int game_id) const;

    SimulationConfig config_;
    std::vector<GameObserver*> observers_;
    std::vector<uint64_t> seeds_;
    uint64_t base_seed_;
};

} // namespace cribbage
