#pragma once

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/player.hpp"
#include "engine/dice.hpp"
#include "engine/game_state.hpp"
#include "engine/ai_controller.hpp"
#include <array>
#include <functional>
#include <optional>

namespace castle_wars {

// ==============================================================================
// Commands - the action API offered to whoever controls a side
// ==============================================================================

enum class Controller : u8 {
    External = 0,   // Commands arrive through submit()
    AI       = 1    // AIController buys at the start of every end_turn()
};

enum class CommandType : u8 {
    EndTurn       = 0,
    BuildSpawn    = 1,
    UpgradeUnit   = 2,
    UpgradeCastle = 3,
    QueryOpponent = 4
};

struct Command {
    CommandType type = CommandType::EndTurn;
    Quantity quantity;
    UnitAttribute unit_attribute = UnitAttribute::Health;
    CastleAttribute castle_attribute = CastleAttribute::Income;

    static Command end_turn() { return Command{}; }

    static Command build_spawn(Quantity q) {
        Command c;
        c.type = CommandType::BuildSpawn;
        c.quantity = q;
        return c;
    }

    static Command upgrade_unit(UnitAttribute attr, Quantity q) {
        Command c;
        c.type = CommandType::UpgradeUnit;
        c.unit_attribute = attr;
        c.quantity = q;
        return c;
    }

    static Command upgrade_castle(CastleAttribute attr, Quantity q) {
        Command c;
        c.type = CommandType::UpgradeCastle;
        c.castle_attribute = attr;
        c.quantity = q;
        return c;
    }

    static Command query_opponent() {
        Command c;
        c.type = CommandType::QueryOpponent;
        return c;
    }
};

struct CommandResponse {
    ActionResult result = ActionResult::Applied;
    std::optional<PlayerStats> opponent;   // Set for QueryOpponent only
};

// ==============================================================================
// Game Runner - owns both sides and sequences turns and ticks
// ==============================================================================
//
// Turn: both sides collect income, armies are raised on spawn turns, then
// `ticks_per_turn` ticks run. In each tick the player's armies act, then the
// player's castle, then the computer's armies and castle. Dead units are
// purged after both sides acted, the win condition is checked and land
// income recomputed. A decided game stops at once; otherwise every survivor
// and both castles regenerate when the turn ends.
//

class GameRunner {
public:
    using TickObserver = std::function<void(const BattleSnapshot&)>;

    // Throws std::invalid_argument when the configuration does not validate
    explicit GameRunner(const GameConfig& config = GameConfig{}, u64 seed = 0);

    void set_controller(Side side, Controller controller) {
        controllers_[side_index(side)] = controller;
    }

    Controller controller(Side side) const { return controllers_[side_index(side)]; }

    // Called after every tick, including the tick that decides the game
    void set_tick_observer(TickObserver observer) { observer_ = std::move(observer); }

    // Apply one command for `side`. Everything is rejected with GameOver
    // once a castle has fallen.
    CommandResponse submit(Side side, const Command& command);

    // AI purchases, then one full turn
    GameOutcome end_turn();

    BattleSnapshot snapshot() const;

    // Turn being planned (1-based); once decided, the turn that ended it
    u32 turn() const { return turn_; }
    u32 turns_played() const { return is_over() ? turn_ : turn_ - 1; }

    // 0 on a spawning turn
    u32 turns_to_spawn() const;

    GameOutcome outcome() const { return outcome_; }
    bool is_over() const { return outcome_ != GameOutcome::Ongoing; }

    // Damage totals plus the kill, death and gold counters of both players
    GameStats statistics() const;

    const GameConfig& config() const { return config_; }

    Player& player(Side side) { return players_[side_index(side)]; }
    const Player& player(Side side) const { return players_[side_index(side)]; }

    DiceRoller& dice() { return dice_; }

private:
    GameConfig config_;
    DiceRoller dice_;
    std::array<Player, SIDE_COUNT> players_;
    std::array<Controller, SIDE_COUNT> controllers_ = {Controller::External, Controller::AI};
    GameStats stats_;
    TickObserver observer_;

    u32 turn_ = 1;
    u32 tick_ = 0;
    GameOutcome outcome_ = GameOutcome::Ongoing;

    void run_turn();
    void run_tick();
    void act(Side side);
    void settle_tick();
    void check_outcome();

    SideSnapshot side_snapshot(Side side) const;
};

} // namespace castle_wars
