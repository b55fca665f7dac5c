#include "core/army.hpp"
#include "core/player.hpp"
#include "engine/dice.hpp"
#include <iostream>
#include <cassert>
#include <set>
#include <vector>

using namespace castle_wars;

GameConfig small_field() {
    GameConfig config;
    config.distance = 10;   // Castles at 0 and 11
    return config;
}

Unit make_unit(UnitId id, i64 health = 5, i64 reward = 1) {
    UnitProfile profile;
    profile.health = health;
    profile.gold_reward = reward;
    return Unit(id, profile, 5.0);
}

std::vector<Unit> make_units(UnitId first, int count, i64 health = 5) {
    std::vector<Unit> units;
    for (int i = 0; i < count; ++i) {
        units.push_back(make_unit(first + static_cast<UnitId>(i), health));
    }
    return units;
}

std::set<UnitId> member_ids(const Army& army) {
    std::set<UnitId> ids;
    for (const Unit& unit : army.members) ids.insert(unit.id);
    return ids;
}

void test_move_and_castle_range() {
    Castle enemy_castle(Side::Computer, 11, -1, 1000, 0.1);
    Army army(1, Side::Player, 8, 1, make_units(1, 1));

    assert(!army.is_castle_in_range(enemy_castle));
    army.move();
    assert(army.position == 9);
    assert(!army.is_castle_in_range(enemy_castle));
    army.move();
    assert(army.position == 10);
    assert(army.is_castle_in_range(enemy_castle));

    Army left(2, Side::Computer, 3, -1, make_units(2, 1));
    left.move();
    assert(left.position == 2);
    std::cout << "[PASS] test_move_and_castle_range" << std::endl;
}

void test_purge_pays_rewards() {
    Player owner(Side::Player, small_field());
    Player enemy(Side::Computer, small_field());

    std::vector<Unit> units = {make_unit(1, 5, 1), make_unit(2, 5, 5), make_unit(3, 5, 10)};
    units[1].health.current = 0;
    units[2].health.current = 0;
    Army army(1, Side::Player, 1, 1, units);

    i64 gold_before = enemy.gold;
    i64 earned_before = enemy.gold_earned;
    u32 dead = army.purge_dead_members(enemy);

    assert(dead == 2);
    assert(enemy.gold == gold_before + 15);
    assert(enemy.gold_earned == earned_before + 15);
    assert(enemy.kills == 2);
    assert(army.members.size() == 1);
    assert(army.members[0].id == 1);
    assert(owner.kills == 0);
    std::cout << "[PASS] test_purge_pays_rewards" << std::endl;
}

void test_acquire_same_cell_first() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(7, Side::Computer, 5, -1, make_units(100, 2));
    enemy.armies.emplace_back(8, Side::Computer, 6, -1, make_units(200, 2));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(1);

    Army army(1, Side::Player, 5, 1, make_units(1, 3));
    assert(army.acquire_target(front, dice));
    assert(army.target == TargetRef::army(7));
    // Same-cell engagement leaves unit targets to be drawn when fighting
    for (const Unit& unit : army.members) {
        assert(!unit.target.is_set());
    }
    std::cout << "[PASS] test_acquire_same_cell_first" << std::endl;
}

void test_acquire_ahead_draws_live_units() {
    Player enemy(Side::Computer, small_field());
    std::vector<Unit> ahead = make_units(100, 4);
    ahead[0].health.current = 0;
    ahead[2].health.current = 0;
    enemy.armies.emplace_back(9, Side::Computer, 6, -1, ahead);
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(77);

    Army army(1, Side::Player, 5, 1, make_units(1, 50));
    assert(army.acquire_target(front, dice));
    assert(army.target == TargetRef::army(9));

    // Only live members are ever drawn, and both get picked over 50 draws
    std::set<UnitId> drawn;
    for (const Unit& unit : army.members) {
        assert(unit.target.is_unit());
        assert(unit.target.id == 101 || unit.target.id == 103);
        drawn.insert(unit.target.id);
    }
    assert(drawn.size() == 2);
    std::cout << "[PASS] test_acquire_ahead_draws_live_units" << std::endl;
}

void test_acquire_prefers_army_over_castle() {
    Player enemy(Side::Computer, small_field());
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(3);

    Army army(1, Side::Player, 10, 1, make_units(1, 2));
    assert(army.acquire_target(front, dice));
    assert(army.target.is_castle());
    for (const Unit& unit : army.members) {
        assert(unit.target.is_castle());
    }

    // An enemy army stepping out of the castle is preferred
    enemy.armies.emplace_back(3, Side::Computer, 11, -1, make_units(100, 1));
    assert(army.acquire_target(front, dice));
    assert(army.target == TargetRef::army(3));
    for (const Unit& unit : army.members) {
        assert(unit.target == TargetRef::unit(100));
    }
    std::cout << "[PASS] test_acquire_prefers_army_over_castle" << std::endl;
}

void test_acquire_ignores_dead_armies() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(3, Side::Computer, 5, -1, make_units(100, 2, 0));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(3);

    Army army(1, Side::Player, 4, 1, make_units(1, 2));
    assert(!army.acquire_target(front, dice));
    assert(!army.target.is_set());
    std::cout << "[PASS] test_acquire_ignores_dead_armies" << std::endl;
}

void test_has_target_clears_destroyed_army() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(3, Side::Computer, 6, -1, make_units(100, 2));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(5);

    Army army(1, Side::Player, 5, 1, make_units(1, 1));
    assert(army.acquire_target(front, dice));
    assert(army.has_target(front));

    for (Unit& unit : enemy.armies[0].members) unit.health.current = 0;
    assert(!army.has_target(front));
    assert(!army.target.is_set());

    // A purged army no longer resolves at all
    army.target = TargetRef::army(3);
    enemy.armies.clear();
    assert(!army.has_target(front));
    std::cout << "[PASS] test_has_target_clears_destroyed_army" << std::endl;
}

void test_refresh_units_targets() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(3, Side::Computer, 6, -1, make_units(100, 2));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(9);

    Army army(1, Side::Player, 5, 1, make_units(1, 3));
    army.target = TargetRef::army(3);
    army.members[0].target = TargetRef::unit(100);
    army.members[1].target = TargetRef::unit(101);
    army.members[2].target = TargetRef::castle();

    enemy.armies[0].members[0].health.current = 0;
    army.refresh_units_targets(front, dice);

    assert(army.members[0].target == TargetRef::unit(101));  // Only live one left
    assert(army.members[1].target == TargetRef::unit(101));
    assert(army.members[2].target.is_castle());              // Castle targets kept
    std::cout << "[PASS] test_refresh_units_targets" << std::endl;
}

void test_fight_dead_members_still_strike() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(3, Side::Computer, 6, -1, make_units(100, 1, 20));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(11);

    Army army(1, Side::Player, 5, 1, make_units(1, 2));
    assert(army.acquire_target(front, dice));

    // Killed earlier in this tick, not yet purged
    army.members[1].health.current = 0;

    FightResult result = army.fight(front, dice);
    assert(result.damage_to_units == 2);
    assert(result.damage_to_castle == 0);
    assert(enemy.armies[0].members[0].health.current == 18);
    std::cout << "[PASS] test_fight_dead_members_still_strike" << std::endl;
}

void test_fight_against_castle() {
    Player enemy(Side::Computer, small_field());
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(13);

    UnitProfile heavy;
    heavy.damage = 40;
    std::vector<Unit> units = {Unit(1, heavy, 5.0), Unit(2, heavy, 5.0)};
    Army army(1, Side::Player, 10, 1, units);

    assert(army.acquire_target(front, dice));
    FightResult result = army.fight(front, dice);
    assert(result.damage_to_castle == 8);   // 40 * 0.1 per unit
    assert(enemy.castle.health.current == 9992);
    std::cout << "[PASS] test_fight_against_castle" << std::endl;
}

void test_merge_membership_is_commutative() {
    Player enemy(Side::Computer, small_field());
    enemy.armies.emplace_back(3, Side::Computer, 6, -1, make_units(100, 3));
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(21);

    auto build = [](Player& p) {
        p.armies.emplace_back(1, Side::Player, 5, 1, make_units(1, 2));
        p.armies.emplace_back(2, Side::Player, 5, 1, make_units(10, 3));
        p.armies[0].target = TargetRef::army(3);
    };

    Player first(Side::Player, small_field());
    build(first);
    first.merge_armies(1, 0, front, dice);

    Player second(Side::Player, small_field());
    build(second);
    second.merge_armies(0, 1, front, dice);

    assert(first.armies.size() == 1);
    assert(second.armies.size() == 1);
    assert(member_ids(first.armies[0]) == member_ids(second.armies[0]));
    assert(first.armies[0].members.size() == 5);

    // Survivor keeps its own target; absorbed units draw from it
    assert(first.armies[0].id == 1);
    assert(first.armies[0].target == TargetRef::army(3));
    for (const Unit& unit : first.armies[0].members) {
        if (unit.id >= 10) {
            assert(unit.target.is_unit());
            assert(unit.target.id >= 100 && unit.target.id <= 102);
        }
    }

    // The other way round the survivor had no target, so none is inherited
    assert(second.armies[0].id == 2);
    assert(!second.armies[0].target.is_set());
    std::cout << "[PASS] test_merge_membership_is_commutative" << std::endl;
}

void test_resolve_collisions() {
    Player enemy(Side::Computer, small_field());
    Frontline front{enemy.armies, enemy.castle};
    DiceRoller dice(4);

    Player self(Side::Player, small_field());
    self.armies.emplace_back(1, Side::Player, 4, 1, make_units(1, 1));
    self.armies.emplace_back(2, Side::Player, 3, 1, make_units(2, 2));

    // Not touching yet
    assert(!self.resolve_army_collisions(1, front, dice));
    assert(self.armies.size() == 2);

    self.armies[1].move();
    assert(self.resolve_army_collisions(1, front, dice));
    assert(self.armies.size() == 1);
    assert(self.armies[0].id == 1);
    assert(self.armies[0].members.size() == 3);
    std::cout << "[PASS] test_resolve_collisions" << std::endl;
}

void test_aggregate_health() {
    Army army(1, Side::Player, 0, 1, make_units(1, 3));
    assert(army.aggregate_health() == 15);
    army.members[0].receive_damage(4);
    assert(army.aggregate_health() == 11);
    assert(army.live_count() == 3);
    army.members[1].receive_damage(9);
    assert(army.aggregate_health() == 6);
    assert(army.live_count() == 2);
    std::cout << "[PASS] test_aggregate_health" << std::endl;
}

int main() {
    std::cout << "=== Army Tests ===" << std::endl;

    test_move_and_castle_range();
    test_purge_pays_rewards();
    test_acquire_same_cell_first();
    test_acquire_ahead_draws_live_units();
    test_acquire_prefers_army_over_castle();
    test_acquire_ignores_dead_armies();
    test_has_target_clears_destroyed_army();
    test_refresh_units_targets();
    test_fight_dead_members_still_strike();
    test_fight_against_castle();
    test_merge_membership_is_commutative();
    test_resolve_collisions();
    test_aggregate_health();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
