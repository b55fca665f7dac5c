#pragma once

#include "core/types.hpp"
#include "core/unit.hpp"
#include "core/castle.hpp"
#include <vector>

namespace castle_wars {

class DiceRoller;
struct Player;

// ==============================================================================
// Frontline - the enemy side as seen by one army: its armies and its castle
// ==============================================================================
//
// Armies and units only hold handles (ids) to enemy entities. The frontline
// is how those handles are resolved against the live collections owned by
// the enemy player.
//

struct Frontline {
    std::vector<Army>& armies;
    Castle& castle;

    Army* find_army(ArmyId id);
    Army* army_at(i32 position);
    Unit* find_unit(UnitId id);
};

// ==============================================================================
// Fight Result - damage produced by one combat exchange
// ==============================================================================

struct FightResult {
    i64 damage_to_units  = 0;
    i64 damage_to_castle = 0;
};

// ==============================================================================
// Army - a group of units sharing a cell and a march direction
// ==============================================================================

struct Army {
    ArmyId id = INVALID_ID;
    Side owner = Side::Player;
    i32 position  = 0;
    i32 direction = 1;       // +1 or -1, fixed per side
    i32 speed     = 1;       // Cells per move
    std::vector<Unit> members;
    TargetRef target;        // An enemy army or the enemy castle

    Army() = default;

    Army(ArmyId aid, Side side, i32 pos, i32 dir, std::vector<Unit> units)
        : id(aid), owner(side), position(pos), direction(dir), members(std::move(units)) {}

    // Handle of the player whose castle this army marches on
    Side enemy() const { return opponent(owner); }

    bool is_empty() const { return members.empty(); }

    // Sum of member health; this is the army's visible "hp"
    i64 aggregate_health() const {
        i64 total = 0;
        for (const Unit& unit : members) total += unit.health.current;
        return total;
    }

    size_t live_count() const {
        size_t count = 0;
        for (const Unit& unit : members) {
            if (unit.is_alive()) ++count;
        }
        return count;
    }

    void move() { position += direction * speed; }

    bool is_castle_in_range(const Castle& enemy_castle) const {
        i32 gap = position - enemy_castle.position;
        return (gap < 0 ? -gap : gap) <= 1;
    }

    // Lazily clears a target that has been destroyed or no longer exists
    bool has_target(Frontline& front);

    // Target selection, in order: enemy army in this cell, enemy army in the
    // next cell (every member draws its own random live enemy), enemy castle
    // in range. Returns false when nothing can be engaged.
    bool acquire_target(Frontline& front, DiceRoller& dice);

    // Point every member at `other` the way acquire_target would: a fresh
    // random live unit each when it is an army, the castle when it is the castle
    void copy_target_from(const TargetRef& other, Frontline& front, DiceRoller& dice);

    // Members whose unit target died draw a new one from the target army.
    // Castle targets are left alone.
    void refresh_units_targets(Frontline& front, DiceRoller& dice);

    // One combat exchange: every member attacks, then targets are refreshed
    FightResult fight(Frontline& front, DiceRoller& dice);

    void refresh_attack_rate() {
        for (Unit& unit : members) unit.refresh_attack_rate();
    }

    void regenerate_members() {
        for (Unit& unit : members) unit.regenerate();
    }

    // Remove dead members, paying each one's reward to `enemy` and crediting
    // its kills. Returns the number removed so the owner can count deaths.
    u32 purge_dead_members(Player& enemy);
};

// True when the unit's target resolves to something still alive
bool has_live_target(const Unit& unit, Frontline& front);

} // namespace castle_wars
