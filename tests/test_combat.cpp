#include "core/health.hpp"
#include "core/unit.hpp"
#include "core/castle.hpp"
#include "core/army.hpp"
#include <iostream>
#include <cassert>
#include <vector>

using namespace castle_wars;

Unit make_unit(UnitId id, i64 health = 5, i64 damage = 1, f64 attack_speed = 1.0) {
    UnitProfile profile;
    profile.health = health;
    profile.damage = damage;
    profile.attack_speed = attack_speed;
    return Unit(id, profile, 5.0);
}

void test_health_stays_in_bounds() {
    Health h(20, 7);

    assert(h.apply_damage(8) == 8);
    assert(h.current == 12);
    h.regenerate();
    assert(h.current == 19);
    h.regenerate();
    assert(h.current == 20);   // Clamped at max

    assert(h.apply_damage(50) == 20);
    assert(h.current == 0);    // Clamped at zero
    assert(h.is_dead());
    assert(h.apply_damage(3) == 0);

    // Negative amounts are not healing
    Health g(10, 0);
    assert(g.apply_damage(-5) == 0);
    assert(g.current == 10);

    // Arbitrary sequence never leaves [0, max]
    Health k(9, 4);
    for (int i = 0; i < 50; ++i) {
        if (i % 3 == 0) k.regenerate();
        else k.apply_damage(i % 7);
        assert(k.current >= 0 && k.current <= k.max);
    }
    std::cout << "[PASS] test_health_stays_in_bounds" << std::endl;
}

void test_unit_attack_timing() {
    Unit attacker = make_unit(1);
    Unit victim = make_unit(2, 100);

    // Accumulator starts at the threshold: first call hits once
    assert(attacker.attack_rate == 5.0);
    assert(attacker.attack(victim) == 1);
    assert(victim.health.current == 99);
    assert(attacker.attack_rate == 0.0);

    // Then it grows by the attack speed on every call without a hit
    for (int i = 1; i <= 5; ++i) {
        assert(attacker.attack(victim) == 0);
        assert(attacker.attack_rate == static_cast<f64>(i));
    }
    assert(victim.health.current == 99);

    // Back at the threshold: the next call hits again
    assert(attacker.attack(victim) == 1);
    assert(victim.health.current == 98);
    std::cout << "[PASS] test_unit_attack_timing" << std::endl;
}

void test_unit_surplus_gives_multiple_hits() {
    Unit attacker = make_unit(1, 5, 2, 12.0);
    Unit victim = make_unit(2, 100);

    // 12 -> 7 -> 2: two hits in one call
    assert(attacker.attack_rate == 12.0);
    assert(attacker.attack(victim) == 4);
    assert(victim.health.current == 96);
    assert(attacker.attack_rate == 2.0);

    assert(attacker.attack(victim) == 0);
    assert(attacker.attack_rate == 14.0);
    assert(attacker.attack(victim) == 4);
    assert(attacker.attack_rate == 4.0);
    std::cout << "[PASS] test_unit_surplus_gives_multiple_hits" << std::endl;
}

void test_unit_refresh_attack_rate() {
    Unit slow = make_unit(1);
    Unit victim = make_unit(2, 100);
    slow.attack(victim);
    slow.attack(victim);
    assert(slow.attack_rate == 1.0);
    slow.refresh_attack_rate();
    assert(slow.attack_rate == 5.0);

    Unit fast = make_unit(3, 5, 1, 7.5);
    fast.attack(victim);
    fast.refresh_attack_rate();
    assert(fast.attack_rate == 7.5);
    std::cout << "[PASS] test_unit_refresh_attack_rate" << std::endl;
}

void test_unit_damage_does_not_overkill() {
    Unit attacker = make_unit(1, 5, 10);
    Unit victim = make_unit(2, 3);
    assert(attacker.attack(victim) == 3);
    assert(victim.health.current == 0);
    assert(!victim.is_alive());
    std::cout << "[PASS] test_unit_damage_does_not_overkill" << std::endl;
}

void test_castle_mitigation() {
    Castle castle(Side::Player, 0, 1, 1000, 0.1);

    assert(castle.receive_damage(0) == 1);      // Never immune
    assert(castle.health.current == 999);
    assert(castle.receive_damage(100) == 10);
    assert(castle.health.current == 989);
    assert(castle.receive_damage(4) == 1);      // 0.4 rounds to 0, floor of 1
    assert(castle.receive_damage(15) == 2);     // 1.5 rounds to 2
    assert(castle.health.current == 986);

    // A unit hitting a castle goes through the mitigation
    Unit attacker = make_unit(1, 5, 30);
    assert(attacker.attack(castle) == 3);
    assert(castle.health.current == 983);
    std::cout << "[PASS] test_castle_mitigation" << std::endl;
}

void test_castle_hits_whole_army() {
    Castle castle(Side::Computer, 11, -1, 1000, 0.1);
    castle.attack_damage = 3;

    std::vector<Army> enemies;
    enemies.emplace_back(1, Side::Player, 10, 1,
                         std::vector<Unit>{make_unit(1), make_unit(2), make_unit(3, 2)});

    assert(castle.acquire_target(enemies));
    assert(castle.target == 1);

    // Every member is hit at once; the 2 hp unit only loses 2
    assert(castle.attack(enemies) == 8);
    assert(enemies[0].members[0].health.current == 2);
    assert(enemies[0].members[1].health.current == 2);
    assert(enemies[0].members[2].health.current == 0);
    assert(castle.has_target(enemies));

    // Target cleared once the army has no health left
    assert(castle.attack(enemies) == 4);
    assert(enemies[0].aggregate_health() == 0);
    assert(castle.target == INVALID_ID);
    assert(!castle.has_target(enemies));
    std::cout << "[PASS] test_castle_hits_whole_army" << std::endl;
}

void test_castle_target_preference() {
    Castle castle(Side::Player, 0, 1, 1000, 0.1);

    std::vector<Army> enemies;
    enemies.emplace_back(4, Side::Computer, 1, -1, std::vector<Unit>{make_unit(1)});
    enemies.emplace_back(5, Side::Computer, 0, -1, std::vector<Unit>{make_unit(2)});
    enemies.emplace_back(6, Side::Computer, 2, -1, std::vector<Unit>{make_unit(3)});

    // Same cell beats the adjacent cell
    assert(castle.acquire_target(enemies));
    assert(castle.target == 5);

    // Without it, the adjacent cell in the facing direction
    enemies.erase(enemies.begin() + 1);
    assert(castle.acquire_target(enemies));
    assert(castle.target == 4);

    // Two cells away is out of reach
    enemies.erase(enemies.begin());
    assert(!castle.acquire_target(enemies));
    assert(castle.target == INVALID_ID);
    std::cout << "[PASS] test_castle_target_preference" << std::endl;
}

void test_castle_regenerates_to_max() {
    Castle castle(Side::Player, 0, 1, 1000, 0.1);
    castle.health.regen = 10;
    castle.receive_damage(150);
    assert(castle.health.current == 985);
    castle.regenerate();
    assert(castle.health.current == 995);
    castle.regenerate();
    assert(castle.health.current == 1000);
    std::cout << "[PASS] test_castle_regenerates_to_max" << std::endl;
}

int main() {
    std::cout << "=== Combat Tests ===" << std::endl;

    test_health_stays_in_bounds();
    test_unit_attack_timing();
    test_unit_surplus_gives_multiple_hits();
    test_unit_refresh_attack_rate();
    test_unit_damage_does_not_overkill();
    test_castle_mitigation();
    test_castle_hits_whole_army();
    test_castle_target_preference();
    test_castle_regenerates_to_max();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
