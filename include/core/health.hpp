#pragma once

#include "core/types.hpp"
#include <algorithm>

namespace castle_wars {

// ==============================================================================
// Health - damage/regeneration capability shared by units and castles
// ==============================================================================
//
// Composed into Unit and Castle rather than inherited: a castle mitigates
// incoming damage before it reaches its Health, a unit does not, while both
// regenerate the same way. Invariant: 0 <= current <= max.
//

struct Health {
    i64 current = 0;
    i64 max     = 0;
    i64 regen   = 0;   // Restored once per turn

    Health() = default;

    Health(i64 max_health, i64 regen_per_turn)
        : current(max_health), max(max_health), regen(regen_per_turn) {}

    bool is_alive() const { return current > 0; }
    bool is_dead() const { return current <= 0; }

    // Returns the amount actually removed
    i64 apply_damage(i64 amount) {
        if (amount <= 0) return 0;
        i64 removed = std::min(amount, current);
        current -= removed;
        return removed;
    }

    void regenerate() {
        if (current < max) {
            current = std::min(max, current + regen);
        }
    }
};

} // namespace castle_wars
