#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace castle_wars {

// ==============================================================================
// Fundamental Types
// ==============================================================================

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Handles for cross references between entities. Ids are unique per side and
// never reused, so a stale handle simply fails to resolve.
using UnitId = u32;
using ArmyId = u32;

constexpr UnitId INVALID_ID = 0;

// ==============================================================================
// Target Handles
// ==============================================================================

enum class TargetKind : u8 {
    None   = 0,
    Unit   = 1,   // A member of an enemy army, by UnitId
    Army   = 2,   // A whole enemy army, by ArmyId
    Castle = 3    // The enemy castle
};

struct TargetRef {
    TargetKind kind = TargetKind::None;
    u32 id = INVALID_ID;

    static constexpr TargetRef none() { return {}; }
    static constexpr TargetRef unit(UnitId uid) { return {TargetKind::Unit, uid}; }
    static constexpr TargetRef army(ArmyId aid) { return {TargetKind::Army, aid}; }
    static constexpr TargetRef castle() { return {TargetKind::Castle, INVALID_ID}; }

    constexpr bool is_set() const { return kind != TargetKind::None; }
    constexpr bool is_castle() const { return kind == TargetKind::Castle; }
    constexpr bool is_army() const { return kind == TargetKind::Army; }
    constexpr bool is_unit() const { return kind == TargetKind::Unit; }

    constexpr bool operator==(const TargetRef& other) const {
        return kind == other.kind && id == other.id;
    }
};

// ==============================================================================
// Sides
// ==============================================================================

enum class Side : u8 {
    Player   = 0,   // Castle at cell 0, marches towards higher cells
    Computer = 1    // Castle at the far end, marches towards cell 0
};

constexpr size_t SIDE_COUNT = 2;

inline constexpr Side opponent(Side side) {
    return side == Side::Player ? Side::Computer : Side::Player;
}

inline constexpr size_t side_index(Side side) {
    return static_cast<size_t>(side);
}

inline const char* side_name(Side side) {
    return side == Side::Player ? "player" : "computer";
}

// ==============================================================================
// Upgradeable Attributes
// ==============================================================================

enum class UnitAttribute : u8 {
    Health      = 0,
    Damage      = 1,
    AttackSpeed = 2,
    Regen       = 3,

    COUNT
};

enum class CastleAttribute : u8 {
    Income = 0,
    Damage = 1,
    Regen  = 2,
    Health = 3,

    COUNT
};

constexpr size_t UNIT_ATTRIBUTE_COUNT   = static_cast<size_t>(UnitAttribute::COUNT);
constexpr size_t CASTLE_ATTRIBUTE_COUNT = static_cast<size_t>(CastleAttribute::COUNT);

inline const char* attribute_name(UnitAttribute attr) {
    switch (attr) {
        case UnitAttribute::Health:      return "hp";
        case UnitAttribute::Damage:      return "damage";
        case UnitAttribute::AttackSpeed: return "attack_speed";
        case UnitAttribute::Regen:       return "regen";
        default:                         return "unknown";
    }
}

inline const char* attribute_name(CastleAttribute attr) {
    switch (attr) {
        case CastleAttribute::Income: return "income";
        case CastleAttribute::Damage: return "damage";
        case CastleAttribute::Regen:  return "regen";
        case CastleAttribute::Health: return "hp";
        default:                      return "unknown";
    }
}

// ==============================================================================
// Economy Results
// ==============================================================================

enum class ActionResult : u8 {
    Applied           = 0,
    InsufficientFunds = 1,
    GameOver          = 2    // The battle has already been decided
};

// Purchase quantity: an explicit count, or as many as current gold allows
struct Quantity {
    u32 count = 1;
    bool max_affordable = false;

    static constexpr Quantity of(u32 n) { return Quantity{n, false}; }
    static constexpr Quantity max() { return Quantity{0, true}; }

    // Resolve against current gold and a unit price
    u64 resolve(i64 gold, i64 price) const {
        if (!max_affordable) return count;
        if (price <= 0 || gold <= 0) return 0;
        return static_cast<u64>(gold / price);
    }
};

} // namespace castle_wars
