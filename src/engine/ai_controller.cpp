#include "engine/ai_controller.hpp"
#include "engine/dice.hpp"
#include <algorithm>
#include <cassert>

namespace castle_wars {

const char* action_name(AIAction action) {
    switch (action) {
        case AIAction::Spawn:           return "spawn";
        case AIAction::Income:          return "income";
        case AIAction::UnitHealth:      return "unit_hp";
        case AIAction::UnitDamage:      return "unit_dmg";
        case AIAction::UnitAttackSpeed: return "unit_attack_speed";
        case AIAction::UnitRegen:       return "unit_regen";
        case AIAction::CastleDamage:    return "castle_dmg";
        case AIAction::CastleRegen:     return "castle_regen";
        case AIAction::CastleHealth:    return "castle_hp";
        default:                        return "unknown";
    }
}

// ==============================================================================
// Weighted Selection
// ==============================================================================

i64 AIController::action_cost(AIAction action, const GameConfig& config) {
    switch (action) {
        case AIAction::Spawn:           return config.spawn_cost;
        case AIAction::Income:          return config.castle_upgrade(CastleAttribute::Income).price;
        case AIAction::UnitHealth:      return config.unit_upgrade(UnitAttribute::Health).price;
        case AIAction::UnitDamage:      return config.unit_upgrade(UnitAttribute::Damage).price;
        case AIAction::UnitAttackSpeed: return config.unit_upgrade(UnitAttribute::AttackSpeed).price;
        case AIAction::UnitRegen:       return config.unit_upgrade(UnitAttribute::Regen).price;
        case AIAction::CastleDamage:    return config.castle_upgrade(CastleAttribute::Damage).price;
        case AIAction::CastleRegen:     return config.castle_upgrade(CastleAttribute::Regen).price;
        case AIAction::CastleHealth:    return config.castle_upgrade(CastleAttribute::Health).price;
        default:                        return 0;
    }
}

std::vector<Threshold> AIController::to_thresholds(const StrategyTable& table) {
    StrategyTable sorted = table;
    std::sort(sorted.begin(), sorted.end(), [](const Weight& a, const Weight& b) {
        if (a.percent != b.percent) return a.percent < b.percent;
        return static_cast<u8>(a.action) > static_cast<u8>(b.action);
    });

    std::vector<Threshold> thresholds;
    thresholds.reserve(sorted.size());
    u32 running = 0;
    for (const Weight& w : sorted) {
        running += w.percent;
        thresholds.push_back({running, w.action});
    }
    assert(running <= 100 && "strategy table exceeds 100 percent");
    return thresholds;
}

WeightedStrategy AIController::build_strategy(const StrategyTable& table, i64 gold,
                                              const GameConfig& config) {
    StrategyTable affordable;
    affordable.reserve(table.size());
    for (const Weight& w : table) {
        if (action_cost(w.action, config) <= gold) {
            affordable.push_back(w);
        }
    }

    WeightedStrategy strategy;
    strategy.thresholds = to_thresholds(affordable);
    strategy.total = strategy.thresholds.empty() ? 0 : strategy.thresholds.back().upto;
    return strategy;
}

std::optional<AIAction> AIController::pick(const WeightedStrategy& strategy, u32 draw) {
    for (const Threshold& t : strategy.thresholds) {
        if (draw <= t.upto) return t.action;
    }
    return std::nullopt;
}

std::optional<AIAction> AIController::choose(const WeightedStrategy& strategy, DiceRoller& dice) {
    if (strategy.empty()) return std::nullopt;
    return pick(strategy, dice.roll_range(1, strategy.total));
}

// ==============================================================================
// Strategy Cascade
// ==============================================================================

StrategyTable AIController::choose_table(const Player& self, const PlayerStats& enemy,
                                         u32 turns_to_spawn) {
    // Balanced default
    StrategyTable table = {
        {AIAction::Spawn, 25}, {AIAction::Income, 45}, {AIAction::UnitHealth, 10},
        {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10}
    };

    // Own development stage: first matching rule wins
    if (self.spawn_slots == 0) {
        table = {{AIAction::Spawn, 100}};
    } else if (self.income < 500) {
        table = {
            {AIAction::Income, 70}, {AIAction::Spawn, 20}, {AIAction::UnitHealth, 5},
            {AIAction::UnitDamage, 3}, {AIAction::UnitAttackSpeed, 1}, {AIAction::UnitRegen, 1}
        };
    } else if (self.income < 5000) {
        table = {
            {AIAction::Income, 90}, {AIAction::Spawn, 5}, {AIAction::UnitHealth, 2},
            {AIAction::UnitDamage, 1}, {AIAction::UnitAttackSpeed, 1}, {AIAction::UnitRegen, 1}
        };
    } else if (self.income < 10000) {
        table = {
            {AIAction::Income, 60}, {AIAction::Spawn, 10}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 9}, {AIAction::UnitRegen, 1}
        };
    } else if (self.unit_level(UnitAttribute::Health) < 4) {
        table = {
            {AIAction::Spawn, 30}, {AIAction::Income, 35}, {AIAction::UnitHealth, 15},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10}
        };
    } else if (self.spawn_slots > 2) {
        table = {
            {AIAction::Spawn, 10}, {AIAction::Income, 45}, {AIAction::UnitHealth, 15},
            {AIAction::UnitDamage, 15}, {AIAction::UnitAttackSpeed, 10}, {AIAction::UnitRegen, 5}
        };
    }

    // Enemy unit power: each higher tier replaces the previous one
    u32 enemy_power = enemy.unit_level_sum();
    if (enemy_power > 200) {
        table = {
            {AIAction::Spawn, 10}, {AIAction::Income, 50}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10}, {AIAction::UnitRegen, 10}
        };
    }
    if (enemy_power > 500) {
        table = {
            {AIAction::Spawn, 10}, {AIAction::Income, 45}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10}, {AIAction::UnitRegen, 10},
            {AIAction::CastleHealth, 5}
        };
    }
    if (enemy_power > 1000) {
        table = {
            {AIAction::Spawn, 20}, {AIAction::Income, 40}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10}, {AIAction::CastleHealth, 10}
        };
    }
    if (enemy_power > 2000) {
        table = {
            {AIAction::Spawn, 20}, {AIAction::Income, 30}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10},
            {AIAction::CastleDamage, 5}, {AIAction::CastleHealth, 15}
        };
    }

    // Between spawns only income pays off
    if (turns_to_spawn > 0) {
        table = {{AIAction::Income, 100}};
    }

    // Castle rescue, measured against the starting castle health
    const f64 castle_hp = static_cast<f64>(self.castle.health.current);
    const f64 full_hp = static_cast<f64>(self.config.castle_health);
    if (castle_hp < full_hp) {
        table = {
            {AIAction::Spawn, 10}, {AIAction::Income, 10}, {AIAction::UnitHealth, 10},
            {AIAction::UnitDamage, 10}, {AIAction::UnitAttackSpeed, 10},
            {AIAction::CastleDamage, 40}, {AIAction::CastleRegen, 10}
        };
    }
    if (castle_hp < full_hp * 0.9) {
        table = {
            {AIAction::Spawn, 1}, {AIAction::Income, 1}, {AIAction::UnitHealth, 1},
            {AIAction::UnitDamage, 1}, {AIAction::UnitAttackSpeed, 1}, {AIAction::UnitRegen, 1},
            {AIAction::CastleDamage, 70}, {AIAction::CastleRegen, 19}, {AIAction::CastleHealth, 5}
        };
    }
    if (castle_hp < full_hp * 0.4) {
        table = {
            {AIAction::Spawn, 10}, {AIAction::Income, 5}, {AIAction::UnitHealth, 5},
            {AIAction::UnitDamage, 5}, {AIAction::UnitAttackSpeed, 5}, {AIAction::UnitRegen, 5},
            {AIAction::CastleDamage, 25}, {AIAction::CastleRegen, 20}, {AIAction::CastleHealth, 20}
        };
    }

    return table;
}

// ==============================================================================
// Turn
// ==============================================================================

bool AIController::has_spending_surplus(const Player& self, u32 turns_to_spawn) {
    i64 projected = self.gold + self.income * static_cast<i64>(turns_to_spawn) + 1;
    return projected > self.gold_to_spawn_all();
}

ActionResult AIController::perform(Player& self, AIAction action) {
    const Quantity one = Quantity::of(1);
    switch (action) {
        case AIAction::Spawn:           return self.build_spawn_slots(one);
        case AIAction::Income:          return self.upgrade_castle(CastleAttribute::Income, one);
        case AIAction::UnitHealth:      return self.upgrade_unit(UnitAttribute::Health, one);
        case AIAction::UnitDamage:      return self.upgrade_unit(UnitAttribute::Damage, one);
        case AIAction::UnitAttackSpeed: return self.upgrade_unit(UnitAttribute::AttackSpeed, one);
        case AIAction::UnitRegen:       return self.upgrade_unit(UnitAttribute::Regen, one);
        case AIAction::CastleDamage:    return self.upgrade_castle(CastleAttribute::Damage, one);
        case AIAction::CastleRegen:     return self.upgrade_castle(CastleAttribute::Regen, one);
        case AIAction::CastleHealth:    return self.upgrade_castle(CastleAttribute::Health, one);
        default:                        return ActionResult::InsufficientFunds;
    }
}

u32 AIController::take_turn(Player& self, const PlayerStats& enemy, u32 turns_to_spawn,
                            DiceRoller& dice) {
    u32 purchases = 0;
    while (has_spending_surplus(self, turns_to_spawn)) {
        if (self.gold < self.config.cheapest_action_price()) break;

        StrategyTable table = choose_table(self, enemy, turns_to_spawn);
        WeightedStrategy strategy = build_strategy(table, self.gold, self.config);

        std::optional<AIAction> action = choose(strategy, dice);
        if (!action) break;
        if (perform(self, *action) != ActionResult::Applied) break;
        ++purchases;
    }
    return purchases;
}

} // namespace castle_wars
