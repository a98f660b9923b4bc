/**
 * @file config.hpp
 * @brief Simulation settings and command-line parsing.
 *
 * Recognized options:
 * @code
 *   cribbage_sim --n_games N [--no_track_states] [--verbosity {0,1,2}] [--debug]
 *                [--seed S] [--threads T] [--play-order {first,random}]
 *                [--log FILE] [--summary-csv FILE] [--hands-csv FILE]
 * @endcode
 *
 * Verbosity and debug only change what the logger prints; they never
 * affect game logic.
 */

#pragma once

#include "strategy.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cribbage {

/**
 * @brief Result of validation with human-readable error.
 */
struct ValidationResult {
    bool valid;                ///< True if the settings are usable
    std::string error_message; ///< Error description if invalid, empty if valid

    /** @brief Default constructor: valid */
    ValidationResult() : valid(true), error_message("") {}

    /**
     * @brief Construct validation result.
     * @param v Whether settings are valid
     * @param msg Error message (should be empty if v is true)
     */
    ValidationResult(bool v, const std::string& msg) : valid(v), error_message(msg) {}
};

/**
 * @brief Settings for a batch of games.
 */
struct SimulationConfig {
    int n_games;               ///< Games to play (> 0)
    int verbosity;             ///< 0 silent, 1 normal, 2 detailed
    bool track_states;         ///< Record and report per-game seeds
    bool debug;                ///< Extra logging of hands and discards
    bool has_base_seed;        ///< Use base_seed instead of std::random_device
    uint64_t base_seed;        ///< Seeds the per-game seed sequence
    int n_threads;             ///< Worker threads (>= 1)
    RandomStrategy::PlayOrder play_order; ///< Default strategy play order
    std::string log_file;      ///< Copy log output here, empty for none
    std::string summary_csv;   ///< Per-game CSV, empty for none
    std::string hands_csv;     ///< Per-deal CSV, empty for none

    SimulationConfig()
        : n_games(1), verbosity(1), track_states(true), debug(false),
          has_base_seed(false), base_seed(0), n_threads(1),
          play_order(RandomStrategy::FIRST_LEGAL) {}

    /**
     * @brief Check every field.
     * @return ValidationResult naming the first bad field
     */
    ValidationResult check() const;

    /**
     * @brief Check every field and throw on the first problem.
     * @throws std::invalid_argument with the check() message
     */
    void validate() const;
};

/**
 * @brief Build a config from command-line arguments (program name excluded).
 * @param args Arguments in order, e.g. {"--n_games", "10", "--debug"}
 * @return Validated config
 * @throws std::invalid_argument on unknown options, missing or bad values,
 *         or a missing --n_games
 */
SimulationConfig parse_command_line(const std::vector<std::string>& args);

/** @brief Usage text for the simulator binary */
std::string usage();

} // namespace cribbage
