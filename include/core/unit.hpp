#pragma once

#include "core/types.hpp"
#include "core/health.hpp"
#include <algorithm>
#include <cassert>

namespace castle_wars {

// ==============================================================================
// Unit Profile - effective values stamped onto every newly spawned unit
// ==============================================================================

struct UnitProfile {
    i64 health       = 5;
    i64 damage       = 1;
    i32 speed        = 1;
    f64 attack_speed = 1.0;   // Added to the attack-rate accumulator per idle tick
    i64 regen        = 0;
    i64 gold_reward  = 1;     // Paid to the killer's owner
};

// ==============================================================================
// Unit - a single expendable soldier, owned by exactly one Army
// ==============================================================================

struct Unit {
    UnitId id = INVALID_ID;
    Health health;

    i64 damage       = 1;
    i32 speed        = 1;
    f64 attack_speed = 1.0;
    f64 attack_threshold = 5.0;  // Accumulated rate consumed by one hit
    f64 attack_rate  = 5.0;      // Attack-rate accumulator
    i64 gold_reward  = 1;

    // Weak reference: an enemy unit or the enemy castle, never owned
    TargetRef target;

    Unit() = default;

    Unit(UnitId uid, const UnitProfile& profile, f64 threshold)
        : id(uid)
        , health(profile.health, profile.regen)
        , damage(profile.damage)
        , speed(profile.speed)
        , attack_speed(profile.attack_speed)
        , attack_threshold(threshold)
        , attack_rate(std::max(threshold, profile.attack_speed))
        , gold_reward(profile.gold_reward) {}

    bool is_alive() const { return health.is_alive(); }

    i64 receive_damage(i64 amount) { return health.apply_damage(amount); }

    // Strike the resolved target once per full threshold in the accumulator.
    // A surplus built up by a fast attack speed yields several hits in one
    // call; the accumulator only grows on calls that produced no hit.
    // Returns the damage actually removed from the target.
    template<typename Target>
    i64 attack(Target& victim) {
        assert(victim.health.is_alive() && "attack requires a live target");

        i64 dealt = 0;
        bool hit = false;
        while (attack_rate >= attack_threshold) {
            dealt += victim.receive_damage(damage);
            attack_rate -= attack_threshold;
            hit = true;
        }
        if (!hit) {
            attack_rate += attack_speed;
        }
        return dealt;
    }

    // Called when the unit disengages; partial cooldown is not carried over
    void refresh_attack_rate() {
        attack_rate = std::max(attack_threshold, attack_speed);
    }

    void regenerate() { health.regenerate(); }
};

} // namespace castle_wars
