#include "core/castle.hpp"
#include "core/army.hpp"

namespace castle_wars {

namespace {

Army* find_army(std::vector<Army>& armies, ArmyId id) {
    for (Army& army : armies) {
        if (army.id == id) return &army;
    }
    return nullptr;
}

Army* live_army_at(std::vector<Army>& armies, i32 position) {
    for (Army& army : armies) {
        if (army.position == position && army.aggregate_health() > 0) return &army;
    }
    return nullptr;
}

} // namespace

bool Castle::has_target(std::vector<Army>& enemy_armies) {
    if (target == INVALID_ID) return false;
    const Army* army = find_army(enemy_armies, target);
    if (army == nullptr || army->aggregate_health() == 0) {
        target = INVALID_ID;
        return false;
    }
    return true;
}

bool Castle::acquire_target(std::vector<Army>& enemy_armies) {
    Army* army = live_army_at(enemy_armies, position);
    if (army == nullptr) {
        army = live_army_at(enemy_armies, position + facing);
    }
    target = army ? army->id : INVALID_ID;
    return army != nullptr;
}

i64 Castle::attack(std::vector<Army>& enemy_armies) {
    Army* army = find_army(enemy_armies, target);
    if (army == nullptr) {
        target = INVALID_ID;
        return 0;
    }

    i64 dealt = 0;
    for (Unit& unit : army->members) {
        dealt += unit.receive_damage(attack_damage);
    }
    if (army->aggregate_health() == 0) {
        target = INVALID_ID;
    }
    return dealt;
}

} // namespace castle_wars
