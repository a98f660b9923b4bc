/**
 * @file config.cpp
 * @brief Simulation settings: validation and command-line parsing.
 */

#include "../include/cribbage/config.hpp"
#include <climits>
#include <sstream>
#include <stdexcept>

namespace cribbage {

ValidationResult SimulationConfig::check() const {
    if (n_games <= 0) {
        std::ostringstream oss;
        oss << "n_games must be greater than 0 (got " << n_games << ")";
        return ValidationResult(false, oss.str());
    }

    if (verbosity < 0 || verbosity > 2) {
        std::ostringstream oss;
        oss << "verbosity must be 0, 1 or 2 (got " << verbosity << ")";
        return ValidationResult(false, oss.str());
    }

    if (n_threads < 1) {
        std::ostringstream oss;
        oss << "threads must be at least 1 (got " << n_threads << ")";
        return ValidationResult(false, oss.str());
    }

    return ValidationResult(true, "");
}

void SimulationConfig::validate() const {
    ValidationResult result = check();
    if (!result.valid) {
        throw std::invalid_argument(result.error_message);
    }
}

namespace {

int parse_integer(const std::string& option, const std::string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(option + " expects an integer, got '" + text + "'");
    }
    if (value < INT_MIN || value > INT_MAX) {
        throw std::invalid_argument(option + " is out of range: '" + text + "'");
    }
    return static_cast<int>(value);
}

uint64_t parse_seed(const std::string& text) {
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--seed expects a non-negative integer, got '" + text + "'");
    }
    if (used != text.size() || text[0] == '-') {
        throw std::invalid_argument("--seed expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<uint64_t>(value);
}

} // namespace

SimulationConfig parse_command_line(const std::vector<std::string>& args) {
    SimulationConfig config;
    bool saw_n_games = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Options that take a value
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--n_games") {
            config.n_games = parse_integer(arg, value());
            saw_n_games = true;
        } else if (arg == "--no_track_states") {
            config.track_states = false;
        } else if (arg == "--verbosity") {
            config.verbosity = parse_integer(arg, value());
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--seed") {
            config.base_seed = parse_seed(value());
            config.has_base_seed = true;
        } else if (arg == "--threads") {
            config.n_threads = parse_integer(arg, value());
        } else if (arg == "--play-order") {
            const std::string& order = value();
            if (order == "first") {
                config.play_order = RandomStrategy::FIRST_LEGAL;
            } else if (order == "random") {
                config.play_order = RandomStrategy::RANDOM_LEGAL;
            } else {
                throw std::invalid_argument("--play-order must be 'first' or 'random'");
            }
        } else if (arg == "--log") {
            config.log_file = value();
        } else if (arg == "--summary-csv") {
            config.summary_csv = value();
        } else if (arg == "--hands-csv") {
            config.hands_csv = value();
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (!saw_n_games) {
        throw std::invalid_argument("--n_games is required");
    }

    config.validate();
    return config;
}

std::string usage() {
    return "Usage: cribbage_sim --n_games N [--no_track_states] [--verbosity {0,1,2}] [--debug]\n"
           "                    [--seed S] [--threads T] [--play-order {first,random}]\n"
           "                    [--log FILE] [--summary-csv FILE] [--hands-csv FILE]\n";
}

} // namespace cribbage
