#include "engine/game_runner.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>

using namespace castle_wars;

int main() {
    std::cout << "=== Turn Benchmarks ===" << std::endl;
    std::cout << std::endl;

    // Full AI-vs-AI games, counting turns and ticks
    {
        const u32 games = 200;
        const u32 max_turns = 500;
        u64 turns = 0;
        u32 decided = 0;

        auto start = std::chrono::high_resolution_clock::now();

        for (u32 g = 0; g < games; ++g) {
            GameRunner runner(GameConfig{}, 1000 + g);
            runner.set_controller(Side::Player, Controller::AI);
            runner.set_controller(Side::Computer, Controller::AI);
            while (!runner.is_over() && runner.turn() <= max_turns) {
                runner.end_turn();
            }
            turns += runner.turns_played();
            if (runner.is_over()) decided++;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        double ms = duration.count() > 0 ? static_cast<double>(duration.count()) : 1.0;

        double turns_per_sec = turns * 1000.0 / ms;
        double ticks_per_sec = turns_per_sec * GameConfig{}.ticks_per_turn;

        std::cout << "AI vs AI Games:" << std::endl;
        std::cout << "  Games: " << games << " (" << decided << " decided)" << std::endl;
        std::cout << "  Turns: " << turns << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << turns_per_sec / 1e3 << " thousand turns/sec ("
                  << ticks_per_sec / 1e6 << " million ticks/sec)" << std::endl;
        std::cout << std::endl;
    }

    // Snapshot building, as a renderer would call it every tick
    {
        GameRunner runner(GameConfig{}, 42);
        runner.set_controller(Side::Player, Controller::AI);
        for (int i = 0; i < 20 && !runner.is_over(); ++i) {
            runner.end_turn();
        }

        const u64 iterations = 200'000;
        u64 armies = 0;

        auto start = std::chrono::high_resolution_clock::now();
        for (u64 i = 0; i < iterations; ++i) {
            BattleSnapshot snap = runner.snapshot();
            armies += snap.side(Side::Player).armies.size() + snap.side(Side::Computer).armies.size();
        }
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        double ms = duration.count() > 0 ? static_cast<double>(duration.count()) : 1.0;

        std::cout << "Snapshots:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << iterations * 1000.0 / ms / 1e6 << " million/sec" << std::endl;
        std::cout << "  (Armies seen: " << armies << ")" << std::endl;
    }

    return 0;
}
