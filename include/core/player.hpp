#pragma once

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/unit.hpp"
#include "core/castle.hpp"
#include "core/army.hpp"
#include <array>
#include <vector>

namespace castle_wars {

class DiceRoller;

// ==============================================================================
// Player Stats - the upgrade summary one side may inspect about the other
// ==============================================================================

struct PlayerStats {
    UnitProfile unit;
    std::array<u32, UNIT_ATTRIBUTE_COUNT> unit_levels{};

    i64 castle_income     = 0;
    i64 castle_damage     = 0;
    i64 castle_regen      = 0;
    i64 castle_max_health = 0;
    std::array<u32, CASTLE_ATTRIBUTE_COUNT> castle_levels{};

    u32 spawn_slots = 0;

    u32 unit_level(UnitAttribute attr) const { return unit_levels[static_cast<size_t>(attr)]; }
    u32 castle_level(CastleAttribute attr) const { return castle_levels[static_cast<size_t>(attr)]; }

    // Combined unit upgrade levels, used to judge the enemy's unit power
    u32 unit_level_sum() const {
        u32 total = 0;
        for (u32 level : unit_levels) total += level;
        return total;
    }
};

// ==============================================================================
// Player - one side: castle, armies and economy
// ==============================================================================
//
// Every purchase is atomic: it is either fully paid and applied, or rejected
// with ActionResult::InsufficientFunds and nothing changes. Gold never goes
// negative.
//

struct Player {
    Side side = Side::Player;
    GameConfig config;

    // === Economy ===
    i64 gold          = 0;
    i64 gold_earned   = 0;   // Lifetime, starting gold included
    i64 income        = 0;   // Land income plus castle income
    i64 castle_income = 0;
    u32 spawn_slots   = 0;
    u32 kills         = 0;
    u32 deaths        = 0;

    // === Upgrades ===
    UnitProfile unit;        // Stamped onto units at spawn time
    i64 unit_price = 0;
    std::array<u32, UNIT_ATTRIBUTE_COUNT> unit_levels{};
    std::array<u32, CASTLE_ATTRIBUTE_COUNT> castle_levels{};

    // === Owned entities ===
    Castle castle;
    std::vector<Army> armies;

    UnitId next_unit_id = 1;
    ArmyId next_army_id = 1;

    Player(Side owner, const GameConfig& cfg);

    // One unit per spawn slot while gold covers the unit price
    std::vector<Unit> spawn_units();

    // New army at the castle cell; nullptr when there are no units
    Army* raise_army(std::vector<Unit> units);

    ActionResult build_spawn_slots(Quantity quantity);
    ActionResult upgrade_unit(UnitAttribute attr, Quantity quantity);
    ActionResult upgrade_castle(CastleAttribute attr, Quantity quantity);

    void receive_gold(i64 amount) {
        gold += amount;
        gold_earned += amount;
    }

    // Move every member of `absorbed` into `survivor` and discard `absorbed`.
    // The absorbed units take fresh targets from the survivor's target.
    void merge_armies(size_t absorbed, size_t survivor, Frontline& front, DiceRoller& dice);

    // Merge the army at `index` into the first other army sharing its cell.
    // Returns true when it merged (the army at `index` is gone).
    bool resolve_army_collisions(size_t index, Frontline& front, DiceRoller& dice);

    void purge_empty_armies();

    // Cells from the castle to the furthest army
    i32 territory() const;

    void update_income() {
        income = castle_income + config.land_income * territory();
    }

    i64 gold_to_spawn_all() const {
        return static_cast<i64>(spawn_slots) * unit_price;
    }

    u32 unit_level(UnitAttribute attr) const { return unit_levels[static_cast<size_t>(attr)]; }
    u32 castle_level(CastleAttribute attr) const { return castle_levels[static_cast<size_t>(attr)]; }

    PlayerStats stats() const;
};

} // namespace castle_wars
