#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace castle_wars {

// ==============================================================================
// Upgrade Table Entry
// ==============================================================================

struct UpgradeSpec {
    f64 delta = 0;   // Effective value gained per level
    i64 price = 0;   // Gold per level
};

// ==============================================================================
// Game Configuration - defaults reproduce the classic game balance
// ==============================================================================

struct GameConfig {
    // === Battlefield ===
    i32 distance = 70;              // Cells between the two castles
    u32 ticks_per_turn = 15;
    u32 spawn_interval_turns = 3;   // Spawn cadence, in turns

    // === Castle ===
    i64 castle_health = 10000;
    f64 castle_damage_taken = 0.1;  // Fraction of incoming damage applied

    // === Base unit ===
    i64 unit_health = 5;
    i64 unit_damage = 1;
    i32 unit_speed = 1;
    f64 unit_attack_speed = 1.0;
    i64 unit_regen = 0;
    f64 attack_rate_threshold = 5.0;  // Accumulated rate needed for one hit

    // === Economy ===
    i64 starting_gold = 1000;
    i64 unit_price = 5;
    i64 kill_reward = 1;
    i64 upgrade_price_step = 1;     // Unit price and kill reward growth per unit upgrade
    i64 land_income = 10;           // Per owned cell
    i64 spawn_cost = 200;

    std::array<UpgradeSpec, UNIT_ATTRIBUTE_COUNT> unit_upgrades = {{
        {5.0, 100},     // Health
        {1.0, 100},     // Damage
        {0.1, 100},     // AttackSpeed
        {1.0, 100}      // Regen
    }};

    std::array<UpgradeSpec, CASTLE_ATTRIBUTE_COUNT> castle_upgrades = {{
        {10.0, 100},    // Income
        {5.0, 300},     // Damage
        {10.0, 200},    // Regen
        {1000.0, 500}   // Health
    }};

    const UpgradeSpec& unit_upgrade(UnitAttribute attr) const {
        return unit_upgrades[static_cast<size_t>(attr)];
    }

    const UpgradeSpec& castle_upgrade(CastleAttribute attr) const {
        return castle_upgrades[static_cast<size_t>(attr)];
    }

    // Castle cells sit just outside the battlefield on each end
    i32 castle_position(Side side) const {
        return side == Side::Player ? 0 : distance + 1;
    }

    i32 march_direction(Side side) const {
        return side == Side::Player ? 1 : -1;
    }

    i64 cheapest_action_price() const {
        i64 cheapest = spawn_cost;
        for (const auto& u : unit_upgrades) cheapest = std::min(cheapest, u.price);
        for (const auto& c : castle_upgrades) cheapest = std::min(cheapest, c.price);
        return cheapest;
    }

    // Validate configuration; on failure `error` names the offending field
    bool validate(std::string* error = nullptr) const {
        auto fail = [error](const char* what) {
            if (error) *error = what;
            return false;
        };
        if (distance < 1) return fail("distance must be at least 1");
        if (ticks_per_turn == 0) return fail("ticks_per_turn must be positive");
        if (spawn_interval_turns == 0) return fail("spawn_interval_turns must be positive");
        if (castle_health <= 0) return fail("castle_health must be positive");
        if (castle_damage_taken <= 0.0 || castle_damage_taken > 1.0) {
            return fail("castle_damage_taken must be in (0, 1]");
        }
        if (unit_health <= 0) return fail("unit_health must be positive");
        if (attack_rate_threshold <= 0.0) return fail("attack_rate_threshold must be positive");
        if (starting_gold < 0) return fail("starting_gold must not be negative");
        if (unit_price <= 0 || spawn_cost <= 0) return fail("prices must be positive");
        for (const auto& u : unit_upgrades) {
            if (u.price <= 0) return fail("unit upgrade prices must be positive");
        }
        for (const auto& c : castle_upgrades) {
            if (c.price <= 0) return fail("castle upgrade prices must be positive");
        }
        return true;
    }
};

} // namespace castle_wars
