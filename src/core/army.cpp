#include "core/army.hpp"
#include "core/player.hpp"
#include "engine/dice.hpp"
#include <algorithm>
#include <cassert>

namespace castle_wars {

namespace {

// Uniform draw over the live members of `pool`. Callers guarantee the pool
// has at least one live member (an army with a target always does).
UnitId draw_live_unit(const Army& pool, DiceRoller& dice) {
    std::vector<UnitId> live;
    live.reserve(pool.members.size());
    for (const Unit& unit : pool.members) {
        if (unit.is_alive()) live.push_back(unit.id);
    }
    assert(!live.empty() && "random target drawn from an army with no live units");
    return live[dice.pick_index(live.size())];
}

// Give a unit without a live target a new one consistent with the army target
bool retarget(Unit& unit, const TargetRef& army_target, Frontline& front, DiceRoller& dice) {
    if (army_target.is_castle()) {
        if (!front.castle.is_alive()) return false;
        unit.target = TargetRef::castle();
        return true;
    }
    if (army_target.is_army()) {
        Army* enemy = front.find_army(army_target.id);
        if (enemy == nullptr || enemy->live_count() == 0) return false;
        unit.target = TargetRef::unit(draw_live_unit(*enemy, dice));
        return true;
    }
    return false;
}

} // namespace

// ==============================================================================
// Frontline
// ==============================================================================

Army* Frontline::find_army(ArmyId id) {
    for (Army& army : armies) {
        if (army.id == id) return &army;
    }
    return nullptr;
}

// Armies whose members all died earlier in this tick are awaiting the purge
// and can no longer be engaged
Army* Frontline::army_at(i32 position) {
    for (Army& army : armies) {
        if (army.position == position && army.aggregate_health() > 0) return &army;
    }
    return nullptr;
}

Unit* Frontline::find_unit(UnitId id) {
    for (Army& army : armies) {
        for (Unit& unit : army.members) {
            if (unit.id == id) return &unit;
        }
    }
    return nullptr;
}

bool has_live_target(const Unit& unit, Frontline& front) {
    switch (unit.target.kind) {
        case TargetKind::Castle:
            return front.castle.is_alive();
        case TargetKind::Unit: {
            const Unit* victim = front.find_unit(unit.target.id);
            return victim != nullptr && victim->is_alive();
        }
        default:
            return false;
    }
}

// ==============================================================================
// Army
// ==============================================================================

bool Army::has_target(Frontline& front) {
    if (target.is_castle()) {
        if (!front.castle.is_alive()) target = TargetRef::none();
    } else if (target.is_army()) {
        const Army* enemy = front.find_army(target.id);
        if (enemy == nullptr || enemy->aggregate_health() == 0) target = TargetRef::none();
    }
    return target.is_set();
}

bool Army::acquire_target(Frontline& front, DiceRoller& dice) {
    target = TargetRef::none();

    // Both armies already stepped onto the same cell
    if (Army* here = front.army_at(position)) {
        target = TargetRef::army(here->id);
        return true;
    }

    // Enemy directly ahead: independent draw per member
    if (Army* ahead = front.army_at(position + direction)) {
        target = TargetRef::army(ahead->id);
        for (Unit& unit : members) {
            unit.target = TargetRef::unit(draw_live_unit(*ahead, dice));
        }
        return true;
    }

    if (is_castle_in_range(front.castle)) {
        target = TargetRef::castle();
        for (Unit& unit : members) {
            unit.target = TargetRef::castle();
        }
        return true;
    }

    return false;
}

void Army::copy_target_from(const TargetRef& other, Frontline& front, DiceRoller& dice) {
    if (other.is_army()) {
        Army* enemy = front.find_army(other.id);
        if (enemy == nullptr || enemy->live_count() == 0) return;
        for (Unit& unit : members) {
            unit.target = TargetRef::unit(draw_live_unit(*enemy, dice));
        }
    } else if (other.is_castle()) {
        for (Unit& unit : members) {
            unit.target = TargetRef::castle();
        }
    }
}

void Army::refresh_units_targets(Frontline& front, DiceRoller& dice) {
    if (!target.is_set()) return;

    for (Unit& unit : members) {
        // A dead castle ends the game; it is never a retarget event
        if (unit.target.is_castle()) continue;
        if (has_live_target(unit, front)) continue;
        if (!retarget(unit, target, front, dice)) return;
    }
}

FightResult Army::fight(Frontline& front, DiceRoller& dice) {
    FightResult result;

    // Members killed earlier in this tick still strike: deaths only take
    // effect at the end-of-tick purge
    for (Unit& unit : members) {
        // Units still aimed at the castle follow the army onto an enemy army
        bool stale = !has_live_target(unit, front) || (unit.target.is_castle() && target.is_army());
        if (stale && !retarget(unit, target, front, dice)) {
            continue;
        }

        if (unit.target.is_castle()) {
            result.damage_to_castle += unit.attack(front.castle);
        } else {
            Unit* victim = front.find_unit(unit.target.id);
            assert(victim != nullptr);
            result.damage_to_units += unit.attack(*victim);
        }
    }

    refresh_units_targets(front, dice);
    return result;
}

u32 Army::purge_dead_members(Player& enemy) {
    auto first_dead = std::stable_partition(members.begin(), members.end(),
        [](const Unit& unit) { return unit.is_alive(); });

    u32 dead = 0;
    for (auto it = first_dead; it != members.end(); ++it) {
        enemy.receive_gold(it->gold_reward);
        ++dead;
    }
    members.erase(first_dead, members.end());

    enemy.kills += dead;
    return dead;
}

} // namespace castle_wars
