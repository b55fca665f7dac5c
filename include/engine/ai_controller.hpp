#pragma once

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/player.hpp"
#include <optional>
#include <vector>

namespace castle_wars {

class DiceRoller;

// ==============================================================================
// AI Actions - every purchase the computer can make
// ==============================================================================

enum class AIAction : u8 {
    Spawn           = 0,
    Income          = 1,
    UnitHealth      = 2,
    UnitDamage      = 3,
    UnitAttackSpeed = 4,
    UnitRegen       = 5,
    CastleDamage    = 6,
    CastleRegen     = 7,
    CastleHealth    = 8,

    COUNT
};

const char* action_name(AIAction action);

// Desired frequency of one action, in percent
struct Weight {
    AIAction action;
    u32 percent;
};

// Percentage table; the percentages of one table sum to at most 100
using StrategyTable = std::vector<Weight>;

// Running total of the sorted weights up to and including `action`
struct Threshold {
    u32 upto;
    AIAction action;
};

// Affordable part of a strategy table, ready for a weighted draw
struct WeightedStrategy {
    std::vector<Threshold> thresholds;   // Ascending by `upto`
    u32 total = 0;                       // Achievable weight, the draw range

    bool empty() const { return total == 0; }
};

// ==============================================================================
// AI Controller - weighted random purchasing limited to affordable actions
// ==============================================================================
//
// Each decision picks a percentage table from the situation (own economy,
// enemy unit power, spawn timing, castle damage), drops the actions that
// current gold cannot pay for, and draws one action with probability
// proportional to its percentage among the remaining ones.
//

class AIController {
public:
    static i64 action_cost(AIAction action, const GameConfig& config);

    // Sort by ascending percentage (equal percentages: later action first)
    // and accumulate into cumulative thresholds
    static std::vector<Threshold> to_thresholds(const StrategyTable& table);

    // Keep only the actions `gold` can pay for; `total` shrinks accordingly
    static WeightedStrategy build_strategy(const StrategyTable& table, i64 gold,
                                           const GameConfig& config);

    // First threshold the draw does not exceed; nullopt past the last one
    static std::optional<AIAction> pick(const WeightedStrategy& strategy, u32 draw);

    // Draw uniformly from [1, total]; nullopt when nothing is affordable
    static std::optional<AIAction> choose(const WeightedStrategy& strategy, DiceRoller& dice);

    // Rule cascade selecting the table for the next decision
    static StrategyTable choose_table(const Player& self, const PlayerStats& enemy,
                                      u32 turns_to_spawn);

    // True while projected gold (current plus income until the next spawn)
    // exceeds what the pending spawn slots will cost
    static bool has_spending_surplus(const Player& self, u32 turns_to_spawn);

    // Buy one level of the action
    static ActionResult perform(Player& self, AIAction action);

    // Repeat single purchases while there is a surplus and something is
    // affordable. Returns the number of purchases made.
    static u32 take_turn(Player& self, const PlayerStats& enemy, u32 turns_to_spawn,
                         DiceRoller& dice);
};

} // namespace castle_wars
