/**
 * Castle Wars - two-castle battle and economy simulator
 *
 * Runs computer-vs-computer games on a one-dimensional battlefield: both
 * sides buy spawn slots and upgrades, raise armies that march on the enemy
 * castle, and fight whatever they meet on the way.
 *
 * A single game can be followed turn by turn with -v; larger batches report
 * win rates and average game length for balance checks.
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "engine/game_runner.hpp"

#include <iostream>
#include <iomanip>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace castle_wars;

// ==============================================================================
// CLI Configuration
// ==============================================================================

struct SimConfig {
    GameConfig game;
    u64 seed = 0;
    u32 max_turns = 500;
    u64 num_games = 1;
    bool verbose = false;
    bool show_help = false;
    bool bad_args = false;
};

// ==============================================================================
// Entry Helpers
// ==============================================================================

void print_banner() {
    std::cout << R"(
   ____          _   _       __        __
  / ___|__ _ ___| |_| | ___  \ \      / /_ _ _ __ ___
 | |   / _` / __| __| |/ _ \  \ \ /\ / / _` | '__/ __|
 | |__| (_| \__ \ |_| |  __/   \ V  V / (_| | |  \__ \
  \____\__,_|___/\__|_|\___|    \_/\_/ \__,_|_|  |___/

 Castle Wars Battle & Economy Simulator v1.0
)" << std::endl;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -s <seed>      Random seed (default: 0)\n";
    std::cout << "  -t <turns>     Turn limit per game (default: 500)\n";
    std::cout << "  -n <count>     Number of games to simulate (default: 1)\n";
    std::cout << "  -D <cells>     Battlefield distance (default: 70)\n";
    std::cout << "  -T <ticks>     Ticks per turn (default: 15)\n";
    std::cout << "  -g <gold>      Starting gold (default: 1000)\n";
    std::cout << "  -v             Verbose output (per-turn status of a single game)\n";
    std::cout << "  -h             Show this help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " -v -s 42                     # Follow one game\n";
    std::cout << "  " << prog << " -n 1000 -t 300               # Balance check\n";
    std::cout << "\nGame Rules:\n";
    std::cout << "  - Castles stand at both ends of the battlefield\n";
    std::cout << "  - Armies spawn every few turns and march on the enemy castle\n";
    std::cout << "  - Land up to the furthest army pays income every turn\n";
    std::cout << "  - Winner: the side whose castle still stands\n";
}

SimConfig parse_args(int argc, char* argv[]) {
    SimConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "-h" || arg == "--help") {
                config.show_help = true;
            } else if (arg == "-v" || arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "-s" && i + 1 < argc) {
                config.seed = std::stoull(argv[++i]);
            } else if (arg == "-t" && i + 1 < argc) {
                config.max_turns = static_cast<u32>(std::stoul(argv[++i]));
            } else if (arg == "-n" && i + 1 < argc) {
                config.num_games = std::stoull(argv[++i]);
            } else if (arg == "-D" && i + 1 < argc) {
                config.game.distance = std::stoi(argv[++i]);
            } else if (arg == "-T" && i + 1 < argc) {
                config.game.ticks_per_turn = static_cast<u32>(std::stoul(argv[++i]));
            } else if (arg == "-g" && i + 1 < argc) {
                config.game.starting_gold = std::stoll(argv[++i]);
            } else {
                std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
                config.bad_args = true;
            }
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: " << arg << " expects a number, got: " << argv[i] << std::endl;
            config.bad_args = true;
        } catch (const std::out_of_range&) {
            std::cerr << "Error: " << arg << " value out of range: " << argv[i] << std::endl;
            config.bad_args = true;
        }
    }

    return config;
}

// ==============================================================================
// Reporting
// ==============================================================================

void print_side_status(const SideSnapshot& side) {
    std::cout << "  " << std::left << std::setw(9) << side_name(side.side) << std::right
              << "Gold: " << std::setw(8) << side.gold
              << "  Income: " << std::setw(6) << side.income
              << "  Spawns: " << std::setw(3) << side.spawn_slots
              << "  Kills: " << std::setw(6) << side.kills
              << "  Deaths: " << std::setw(6) << side.deaths
              << "  Castle: " << side.castle_health << "/" << side.castle_max_health
              << "  Armies: " << side.armies.size()
              << std::endl;
    std::cout << "           Unit price: " << side.unit_price
              << "  Gold needed to spawn all: " << side.gold_to_spawn_all
              << "  Land: " << side.territory.cells() << " cells"
              << std::endl;
}

void print_turn_status(const BattleSnapshot& snap) {
    std::cout << "Turn " << snap.turn << " (turns to spawn: " << snap.turns_to_spawn << ")"
              << std::endl;
    print_side_status(snap.side(Side::Player));
    print_side_status(snap.side(Side::Computer));
}

void print_statistics(const GameStats& stats) {
    std::cout << "Game Statistics:" << std::endl;
    std::cout << std::setw(26) << "" << std::setw(12) << "player" << std::setw(12) << "computer"
              << std::endl;

    auto row = [&](const char* label, auto field) {
        std::cout << "  " << std::left << std::setw(24) << label << std::right
                  << std::setw(12) << field(stats[Side::Player])
                  << std::setw(12) << field(stats[Side::Computer]) << std::endl;
    };
    row("Damage to units", [](const SideStats& s) { return s.damage_to_units; });
    row("Damage to castle", [](const SideStats& s) { return s.damage_to_castle; });
    row("Kills", [](const SideStats& s) { return s.kills; });
    row("Deaths", [](const SideStats& s) { return s.deaths; });
    row("Gold earned", [](const SideStats& s) { return s.gold_earned; });
}

// ==============================================================================
// Simulation Functions
// ==============================================================================

GameRunner make_runner(const SimConfig& config, u64 seed) {
    GameRunner runner(config.game, seed);
    runner.set_controller(Side::Player, Controller::AI);
    runner.set_controller(Side::Computer, Controller::AI);
    return runner;
}

void run_single_game(const SimConfig& config) {
    GameRunner runner = make_runner(config, config.seed);

    std::cout << "Running single game (seed " << config.seed << ", up to "
              << config.max_turns << " turns)..." << std::endl << std::endl;

    while (!runner.is_over() && runner.turn() <= config.max_turns) {
        runner.end_turn();
        if (config.verbose) {
            print_turn_status(runner.snapshot());
        }
    }

    std::cout << std::endl;
    if (runner.is_over()) {
        std::cout << "Result: " << outcome_name(runner.outcome()) << " after "
                  << runner.turns_played() << " turns" << std::endl;
    } else {
        std::cout << "Result: turn limit reached after " << runner.turns_played()
                  << " turns" << std::endl;
    }
    std::cout << std::endl;
    print_statistics(runner.statistics());
}

void run_batch(const SimConfig& config) {
    std::cout << "Running " << config.num_games << " games (up to " << config.max_turns
              << " turns each)..." << std::endl;

    u64 player_wins = 0;
    u64 computer_wins = 0;
    u64 draws = 0;
    u64 unfinished = 0;
    u64 total_turns = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (u64 g = 0; g < config.num_games; ++g) {
        GameRunner runner = make_runner(config, config.seed + g);
        while (!runner.is_over() && runner.turn() <= config.max_turns) {
            runner.end_turn();
        }

        switch (runner.outcome()) {
            case GameOutcome::PlayerWins:   player_wins++; break;
            case GameOutcome::ComputerWins: computer_wins++; break;
            case GameOutcome::Draw:         draws++; break;
            case GameOutcome::Ongoing:      unfinished++; break;
        }
        total_turns += runner.turns_played();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    u64 n = config.num_games;
    std::cout << std::endl;
    std::cout << "Results (" << n << " games):" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Player (left) Win Rate: " << (100.0 * player_wins / n) << "%" << std::endl;
    std::cout << "  Computer (right) Win Rate: " << (100.0 * computer_wins / n) << "%" << std::endl;
    std::cout << "  Draw Rate: " << (100.0 * draws / n) << "%" << std::endl;
    std::cout << "  Turn Limit Reached: " << (100.0 * unfinished / n) << "%" << std::endl;
    std::cout << std::endl;
    std::cout << "  Avg Turns Played: " << (1.0 * total_turns / n) << std::endl;

    if (duration.count() > 0) {
        f64 games_per_sec = n * 1000.0 / duration.count();
        std::cout << "\nPerformance: " << std::setprecision(1) << games_per_sec
                  << " games/second" << std::endl;
    }
}

// ==============================================================================
// Main Entry Point
// ==============================================================================

int main(int argc, char* argv[]) {
    SimConfig config = parse_args(argc, argv);

    print_banner();

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (config.bad_args) {
        print_usage(argv[0]);
        return 1;
    }

    std::string error;
    if (!config.game.validate(&error)) {
        std::cerr << "Error: Invalid configuration: " << error << std::endl;
        return 1;
    }

    if (config.num_games == 0) {
        std::cerr << "Error: -n must be at least 1" << std::endl;
        return 1;
    }

    if (config.num_games == 1) {
        run_single_game(config);
    } else {
        run_batch(config);
    }
    return 0;
}
