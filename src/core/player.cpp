#include "core/player.hpp"
#include "engine/dice.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace castle_wars {

namespace {

// Number of purchases to make, or 0 when gold does not cover them
u64 affordable_count(Quantity quantity, i64 gold, i64 price) {
    u64 count = quantity.resolve(gold, price);
    if (count == 0 || price <= 0) return 0;
    u64 can_afford = gold > 0 ? static_cast<u64>(gold / price) : 0;
    return count <= can_afford ? count : 0;
}

i64 scaled(f64 delta, u64 count) {
    return static_cast<i64>(std::llround(delta * static_cast<f64>(count)));
}

} // namespace

Player::Player(Side owner, const GameConfig& cfg)
    : side(owner)
    , config(cfg)
    , gold(cfg.starting_gold)
    , gold_earned(cfg.starting_gold)
    , unit_price(cfg.unit_price)
    , castle(owner, cfg.castle_position(owner), cfg.march_direction(owner),
             cfg.castle_health, cfg.castle_damage_taken) {
    unit.health       = cfg.unit_health;
    unit.damage       = cfg.unit_damage;
    unit.speed        = cfg.unit_speed;
    unit.attack_speed = cfg.unit_attack_speed;
    unit.regen        = cfg.unit_regen;
    unit.gold_reward  = cfg.kill_reward;
}

// ==============================================================================
// Spawning
// ==============================================================================

std::vector<Unit> Player::spawn_units() {
    std::vector<Unit> spawned;
    spawned.reserve(spawn_slots);
    for (u32 slot = 0; slot < spawn_slots; ++slot) {
        if (gold < unit_price) break;
        spawned.emplace_back(next_unit_id++, unit, config.attack_rate_threshold);
        gold -= unit_price;
    }
    return spawned;
}

Army* Player::raise_army(std::vector<Unit> units) {
    if (units.empty()) return nullptr;
    armies.emplace_back(next_army_id++, side, castle.position, castle.facing, std::move(units));
    return &armies.back();
}

// ==============================================================================
// Purchases
// ==============================================================================

ActionResult Player::build_spawn_slots(Quantity quantity) {
    u64 count = affordable_count(quantity, gold, config.spawn_cost);
    if (count == 0) return ActionResult::InsufficientFunds;

    spawn_slots += static_cast<u32>(count);
    gold -= config.spawn_cost * static_cast<i64>(count);
    return ActionResult::Applied;
}

ActionResult Player::upgrade_unit(UnitAttribute attr, Quantity quantity) {
    const UpgradeSpec& spec = config.unit_upgrade(attr);
    u64 count = affordable_count(quantity, gold, spec.price);
    if (count == 0) return ActionResult::InsufficientFunds;

    switch (attr) {
        case UnitAttribute::Health:
            unit.health += scaled(spec.delta, count);
            break;
        case UnitAttribute::Damage:
            unit.damage += scaled(spec.delta, count);
            break;
        case UnitAttribute::AttackSpeed:
            unit.attack_speed += spec.delta * static_cast<f64>(count);
            break;
        case UnitAttribute::Regen:
            unit.regen += scaled(spec.delta, count);
            break;
        default:
            return ActionResult::InsufficientFunds;
    }

    unit_levels[static_cast<size_t>(attr)] += static_cast<u32>(count);
    gold -= spec.price * static_cast<i64>(count);

    // Stronger units cost more and are worth more to the enemy
    unit_price       += config.upgrade_price_step * static_cast<i64>(count);
    unit.gold_reward += config.upgrade_price_step * static_cast<i64>(count);
    return ActionResult::Applied;
}

ActionResult Player::upgrade_castle(CastleAttribute attr, Quantity quantity) {
    const UpgradeSpec& spec = config.castle_upgrade(attr);
    u64 count = affordable_count(quantity, gold, spec.price);
    if (count == 0) return ActionResult::InsufficientFunds;

    i64 gain = scaled(spec.delta, count);
    switch (attr) {
        case CastleAttribute::Income:
            castle_income += gain;
            income += gain;
            break;
        case CastleAttribute::Damage:
            castle.attack_damage += gain;
            break;
        case CastleAttribute::Regen:
            castle.health.regen += gain;
            break;
        case CastleAttribute::Health:
            // Current health catches up through regeneration only
            castle.health.max += gain;
            break;
        default:
            return ActionResult::InsufficientFunds;
    }

    castle_levels[static_cast<size_t>(attr)] += static_cast<u32>(count);
    gold -= spec.price * static_cast<i64>(count);
    return ActionResult::Applied;
}

// ==============================================================================
// Army Bookkeeping
// ==============================================================================

void Player::merge_armies(size_t absorbed, size_t survivor, Frontline& front, DiceRoller& dice) {
    Army& from = armies[absorbed];
    Army& into = armies[survivor];

    from.copy_target_from(into.target, front, dice);
    into.members.insert(into.members.end(),
                        std::make_move_iterator(from.members.begin()),
                        std::make_move_iterator(from.members.end()));
    armies.erase(armies.begin() + static_cast<std::ptrdiff_t>(absorbed));
}

bool Player::resolve_army_collisions(size_t index, Frontline& front, DiceRoller& dice) {
    for (size_t other = 0; other < armies.size(); ++other) {
        if (other == index) continue;
        if (armies[other].position == armies[index].position) {
            merge_armies(index, other, front, dice);
            return true;
        }
    }
    return false;
}

void Player::purge_empty_armies() {
    armies.erase(std::remove_if(armies.begin(), armies.end(),
                                [](const Army& army) { return army.is_empty(); }),
                 armies.end());
}

i32 Player::territory() const {
    i32 furthest = 0;
    for (const Army& army : armies) {
        i32 advance = (army.position - castle.position) * castle.facing;
        furthest = std::max(furthest, advance);
    }
    return std::min(furthest, config.distance);
}

PlayerStats Player::stats() const {
    PlayerStats view;
    view.unit              = unit;
    view.unit_levels       = unit_levels;
    view.castle_income     = castle_income;
    view.castle_damage     = castle.attack_damage;
    view.castle_regen      = castle.health.regen;
    view.castle_max_health = castle.health.max;
    view.castle_levels     = castle_levels;
    view.spawn_slots       = spawn_slots;
    return view;
}

} // namespace castle_wars
