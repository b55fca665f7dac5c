#include "engine/game_runner.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace castle_wars {

GameRunner::GameRunner(const GameConfig& config, u64 seed)
    : config_(config)
    , dice_(seed)
    , players_{Player(Side::Player, config), Player(Side::Computer, config)} {
    std::string error;
    if (!config_.validate(&error)) {
        throw std::invalid_argument("Invalid game configuration: " + error);
    }
}

u32 GameRunner::turns_to_spawn() const {
    u32 interval = config_.spawn_interval_turns;
    return (interval - (turn_ - 1) % interval) % interval;
}

// ==============================================================================
// Action API
// ==============================================================================

CommandResponse GameRunner::submit(Side side, const Command& command) {
    CommandResponse response;
    if (is_over()) {
        response.result = ActionResult::GameOver;
        return response;
    }

    Player& self = player(side);
    switch (command.type) {
        case CommandType::EndTurn:
            end_turn();
            break;
        case CommandType::BuildSpawn:
            response.result = self.build_spawn_slots(command.quantity);
            break;
        case CommandType::UpgradeUnit:
            response.result = self.upgrade_unit(command.unit_attribute, command.quantity);
            break;
        case CommandType::UpgradeCastle:
            response.result = self.upgrade_castle(command.castle_attribute, command.quantity);
            break;
        case CommandType::QueryOpponent:
            response.opponent = player(opponent(side)).stats();
            break;
    }
    return response;
}

GameOutcome GameRunner::end_turn() {
    if (is_over()) return outcome_;

    for (Side side : {Side::Player, Side::Computer}) {
        if (controller(side) == Controller::AI) {
            AIController::take_turn(player(side), player(opponent(side)).stats(),
                                    turns_to_spawn(), dice_);
        }
    }

    run_turn();
    if (!is_over()) ++turn_;
    return outcome_;
}

// ==============================================================================
// Turn and Tick
// ==============================================================================

void GameRunner::run_turn() {
    for (Player& p : players_) {
        p.receive_gold(p.income);
    }

    if (turns_to_spawn() == 0) {
        for (Player& p : players_) {
            p.raise_army(p.spawn_units());
        }
    }

    for (tick_ = 1; tick_ <= config_.ticks_per_turn; ++tick_) {
        run_tick();
        if (observer_) observer_(snapshot());
        if (is_over()) return;
    }
    tick_ = 0;

    for (Player& p : players_) {
        for (Army& army : p.armies) {
            army.regenerate_members();
        }
        p.castle.regenerate();
    }
}

void GameRunner::run_tick() {
    act(Side::Player);
    act(Side::Computer);
    settle_tick();
    check_outcome();
    for (Player& p : players_) {
        p.update_income();
    }
}

void GameRunner::act(Side side) {
    Player& self = player(side);
    Player& enemy = player(opponent(side));
    Frontline front{enemy.armies, enemy.castle};
    SideStats& stats = stats_[side];

    size_t i = 0;
    while (i < self.armies.size()) {
        Army& army = self.armies[i];

        // An enemy army that came into reach takes priority over the castle
        if (army.has_target(front) && army.target.is_castle()) {
            army.acquire_target(front, dice_);
        }

        if (army.has_target(front) || army.acquire_target(front, dice_)) {
            stats.record(army.fight(front, dice_));
            ++i;
            continue;
        }

        army.move();
        army.refresh_attack_rate();
        // A merged army is gone; the next one now sits at index i
        if (!self.resolve_army_collisions(i, front, dice_)) {
            ++i;
        }
    }

    Castle& castle = self.castle;
    if (castle.has_target(enemy.armies) || castle.acquire_target(enemy.armies)) {
        stats.damage_to_units += castle.attack(enemy.armies);
    }
}

void GameRunner::settle_tick() {
    for (Side side : {Side::Player, Side::Computer}) {
        Player& self = player(side);
        Player& enemy = player(opponent(side));
        for (Army& army : self.armies) {
            self.deaths += army.purge_dead_members(enemy);
        }
        self.purge_empty_armies();
    }
}

void GameRunner::check_outcome() {
    bool player_down = !player(Side::Player).castle.is_alive();
    bool computer_down = !player(Side::Computer).castle.is_alive();

    if (player_down && computer_down) {
        outcome_ = GameOutcome::Draw;
    } else if (computer_down) {
        outcome_ = GameOutcome::PlayerWins;
    } else if (player_down) {
        outcome_ = GameOutcome::ComputerWins;
    }
}

// ==============================================================================
// Reporting
// ==============================================================================

GameStats GameRunner::statistics() const {
    GameStats result = stats_;
    for (Side side : {Side::Player, Side::Computer}) {
        const Player& p = player(side);
        result[side].kills = p.kills;
        result[side].deaths = p.deaths;
        result[side].gold_earned = p.gold_earned;
    }
    return result;
}

SideSnapshot GameRunner::side_snapshot(Side side) const {
    const Player& p = player(side);

    SideSnapshot snap;
    snap.side = side;
    snap.castle_health = p.castle.health.current;
    snap.castle_max_health = p.castle.health.max;
    snap.gold = p.gold;
    snap.income = p.income;
    snap.gold_earned = p.gold_earned;
    snap.spawn_slots = p.spawn_slots;
    snap.kills = p.kills;
    snap.deaths = p.deaths;
    snap.unit_price = p.unit_price;
    snap.gold_to_spawn_all = p.gold_to_spawn_all();
    snap.upgrades = p.stats();

    i32 land = p.territory();
    if (land > 0) {
        i32 inner = p.castle.position + p.castle.facing;
        i32 outer = p.castle.position + p.castle.facing * land;
        snap.territory.first = std::min(inner, outer);
        snap.territory.last = std::max(inner, outer);
    }

    snap.armies.reserve(p.armies.size());
    for (const Army& army : p.armies) {
        ArmySnapshot a;
        a.id = army.id;
        a.position = army.position;
        a.members = static_cast<u32>(army.members.size());
        a.health = army.aggregate_health();
        a.engaged = army.target.is_set();
        snap.armies.push_back(a);
    }
    return snap;
}

BattleSnapshot GameRunner::snapshot() const {
    BattleSnapshot snap;
    snap.turn = turn_;
    snap.tick = tick_;
    snap.turns_to_spawn = turns_to_spawn();
    snap.outcome = outcome_;
    snap.sides[side_index(Side::Player)] = side_snapshot(Side::Player);
    snap.sides[side_index(Side::Computer)] = side_snapshot(Side::Computer);
    return snap;
}

} // namespace castle_wars
