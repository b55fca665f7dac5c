#pragma once

#include "core/types.hpp"
#include "core/army.hpp"
#include "core/player.hpp"
#include <array>
#include <vector>

namespace castle_wars {

// ==============================================================================
// Game Outcome
// ==============================================================================

enum class GameOutcome : u8 {
    Ongoing      = 0,
    PlayerWins   = 1,   // Computer castle destroyed
    ComputerWins = 2,   // Player castle destroyed
    Draw         = 3    // Both castles fell in the same tick
};

inline const char* outcome_name(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::Ongoing:      return "ongoing";
        case GameOutcome::PlayerWins:   return "player wins";
        case GameOutcome::ComputerWins: return "computer wins";
        case GameOutcome::Draw:         return "draw";
        default:                        return "unknown";
    }
}

// ==============================================================================
// Game Statistics
// ==============================================================================

struct SideStats {
    i64 damage_to_units  = 0;
    i64 damage_to_castle = 0;   // After castle mitigation
    u32 kills  = 0;
    u32 deaths = 0;
    i64 gold_earned = 0;        // Starting gold included

    void record(const FightResult& fight) {
        damage_to_units  += fight.damage_to_units;
        damage_to_castle += fight.damage_to_castle;
    }
};

struct GameStats {
    std::array<SideStats, SIDE_COUNT> sides{};

    SideStats& operator[](Side side) { return sides[side_index(side)]; }
    const SideStats& operator[](Side side) const { return sides[side_index(side)]; }

    void reset() { sides = {}; }
};

// ==============================================================================
// Battle Snapshot - read-only view handed to renderers and observers
// ==============================================================================

struct ArmySnapshot {
    ArmyId id = INVALID_ID;
    i32 position = 0;
    u32 members = 0;
    i64 health = 0;         // Aggregate member health
    bool engaged = false;   // Holds an enemy army or castle target
};

// Cells owned by one side, [first, last]; first > last means no land
struct Territory {
    i32 first = 1;
    i32 last  = 0;

    bool empty() const { return last < first; }
    i32 cells() const { return empty() ? 0 : last - first + 1; }
};

struct SideSnapshot {
    Side side = Side::Player;

    i64 castle_health     = 0;
    i64 castle_max_health = 0;

    i64 gold        = 0;
    i64 income      = 0;
    i64 gold_earned = 0;
    u32 spawn_slots = 0;
    u32 kills       = 0;
    u32 deaths      = 0;
    i64 unit_price  = 0;
    i64 gold_to_spawn_all = 0;

    PlayerStats upgrades;
    Territory territory;
    std::vector<ArmySnapshot> armies;
};

struct BattleSnapshot {
    u32 turn = 0;
    u32 tick = 0;            // Tick within the turn, 0 before the first tick
    u32 turns_to_spawn = 0;
    GameOutcome outcome = GameOutcome::Ongoing;
    std::array<SideSnapshot, SIDE_COUNT> sides{};

    const SideSnapshot& side(Side s) const { return sides[side_index(s)]; }
};

} // namespace castle_wars
