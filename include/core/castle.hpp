#pragma once

#include "core/types.hpp"
#include "core/health.hpp"
#include <cmath>
#include <vector>

namespace castle_wars {

struct Army;

// ==============================================================================
// Castle - a side's fixed stronghold at one end of the battlefield
// ==============================================================================

struct Castle {
    Side owner = Side::Player;
    i32 position = 0;
    i32 facing = 1;              // Direction of the battlefield as seen from the castle
    Health health;
    i64 attack_damage = 0;       // Dealt to every member of the target army per tick
    f64 damage_taken = 0.1;      // Mitigation factor for incoming damage
    ArmyId target = INVALID_ID;  // Weak reference to an enemy army

    Castle() = default;

    Castle(Side side, i32 pos, i32 dir, i64 max_health, f64 taken_factor)
        : owner(side), position(pos), facing(dir)
        , health(max_health, 0), damage_taken(taken_factor) {}

    bool is_alive() const { return health.is_alive(); }

    // Castles take only a fraction of incoming damage, rounded to the nearest
    // point, but never less than one point per hit
    i64 receive_damage(i64 raw) {
        i64 mitigated = static_cast<i64>(std::llround(static_cast<f64>(raw) * damage_taken));
        if (mitigated <= 0) mitigated = 1;
        return health.apply_damage(mitigated);
    }

    // Drops the target if it no longer exists or has no health left
    bool has_target(std::vector<Army>& enemy_armies);

    // Same-cell army first, then the adjacent cell the castle faces
    bool acquire_target(std::vector<Army>& enemy_armies);

    // Hit every member of the target army at once; returns damage dealt
    i64 attack(std::vector<Army>& enemy_armies);

    void regenerate() { health.regenerate(); }
};

} // namespace castle_wars
