/**
 * @file simulator.cpp
 * @brief Implementation of batch game runs.
 *
 * Key operations:
 *   - run(): draw seeds, play every game, aggregate wins and hands
 *   - replay(): rebuild a single game from its seed
 *
 * Threaded runs:
 *   Workers pull game indices from an atomic counter. Each game records its
 *   deals into a private collector, so workers never share mutable state.
 *   After all workers join, records are forwarded to the observers in game
 *   order, which makes logs and CSV files independent of the thread count.
 *   A failure in any game is rethrown after the join.
 */

#include "../include/cribbage/simulator.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <random>
#include <thread>

namespace cribbage {

namespace {

// Per-game seeds are reported as non-negative 31-bit values
constexpr uint64_t MAX_GAME_SEED = 2147483646ULL;

class DealCollector : public GameObserver {
public:
    void on_deal_complete(const DealRecord& record) override {
        deals.push_back(record);
    }

    std::vector<DealRecord> deals;
};

} // namespace

Simulator::Simulator(const SimulationConfig& config) : config_(config), base_seed_(0) {
    config_.validate();
}

void Simulator::add_observer(GameObserver* observer) {
    if (observer) {
        observers_.push_back(observer);
    }
}

void Simulator::draw_seeds() {
    if (config_.has_base_seed) {
        base_seed_ = config_.base_seed;
    } else {
        std::random_device device;
        base_seed_ = (static_cast<uint64_t>(device()) << 32) | device();
    }

    std::mt19937_64 seed_engine(base_seed_);
    std::uniform_int_distribution<uint64_t> dist(0, MAX_GAME_SEED);

    seeds_.clear();
    seeds_.reserve(config_.n_games);
    for (int i = 0; i < config_.n_games; ++i) {
        seeds_.push_back(dist(seed_engine));
    }
}

Game Simulator::make_game(uint64_t seed, int game_id) const {
    GameConfig game_config;
    game_config.seed = seed;
    game_config.game_id = game_id;
    game_config.track_seed = config_.track_states;

    return Game(game_config,
                std::unique_ptr<Strategy>(new RandomStrategy(config_.play_order)),
                std::unique_ptr<Strategy>(new RandomStrategy(config_.play_order)));
}

SimulationResult Simulator::run() {
    draw_seeds();

    const int n = config_.n_games;
    SimulationResult result;
    result.games.resize(n);

    if (config_.n_threads == 1) {
        for (int i = 0; i < n; ++i) {
            Game game = make_game(seeds_[i], i + 1);
            for (GameObserver* observer : observers_) {
                game.add_observer(observer);
            }
            result.games[i] = game.play_game();
        }
    } else {
        std::vector<std::vector<DealRecord>> deals(n);
        std::vector<std::exception_ptr> errors(n);
        std::atomic<int> next(0);

        auto worker = [&]() {
            for (int i = next++; i < n; i = next++) {
                try {
                    DealCollector collector;
                    Game game = make_game(seeds_[i], i + 1);
                    game.add_observer(&collector);
                    result.games[i] = game.play_game();
                    deals[i].swap(collector.deals);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        };

        int n_workers = std::min(config_.n_threads, n);
        std::vector<std::thread> threads;
        threads.reserve(n_workers);
        for (int t = 0; t < n_workers; ++t) {
            threads.emplace_back(worker);
        }
        for (std::thread& t : threads) {
            t.join();
        }

        for (int i = 0; i < n; ++i) {
            if (errors[i]) {
                std::rethrow_exception(errors[i]);
            }
            for (GameObserver* observer : observers_) {
                for (const DealRecord& record : deals[i]) {
                    observer->on_deal_complete(record);
                }
                observer->on_game_complete(result.games[i]);
            }
        }
    }

    for (const GameSummary& summary : result.games) {
        result.wins[summary.winner]++;
        result.total_hands += summary.hands_played;
    }
    return result;
}

GameSummary Simulator::replay(uint64_t seed, int game_id) const {
    Game game = make_game(seed, game_id);
    return game.play_game();
}

} // namespace cribbage
