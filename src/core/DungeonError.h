#pragma once

#include <cstdint>

// Recoverable failures reported by the floor, renovation and party systems.
// None of these are fatal: callers observe them as rejected actions.
enum class DungeonError : uint8_t {
    None = 0,

    // Floor registry
    InvalidIndex,       // Floor index out of range or floor missing
    MaxFloorsReached,   // Expansion beyond the configured cap
    PlacementBlocked,   // Monster placement collides or floor is full

    // Renovation
    NotInSession,       // Wall edit without an active renovation session
    SessionActive,      // A renovation session is already running
    OccupiedFloor,      // Renovation requested on a non-empty floor
    StairClearance,     // Wall within one unit of a stair
    AlreadyWalled,      // Wall already present at the cell
    NoWall,             // No wall to remove at the cell
    PathBlocked,        // Wall would sever the stair connection

    // Parties
    EmptyParty,         // Party creation without members
    FloorPartyLimit,    // Too many parties on one floor
    UnknownParty,       // Party id not registered
    InvalidEntity,      // Entity missing or lacking combat components
    AlreadyInParty,     // Entity already belongs to a party
    NotAMember,         // Entity is not a member of this party
    AffiliationMismatch // Invader and defender in the same party
};

// Short identifier, e.g. "PathBlocked"
const char* toString(DungeonError error);

// Player-facing explanation of why an action was rejected
const char* describe(DungeonError error);

// Result of an operation producing a pointer into a registry.
// Exactly one of `value` / `error` is meaningful.
template <typename T>
struct DungeonResult {
    T* value = nullptr;
    DungeonError error = DungeonError::None;

    static DungeonResult success(T* v) { return DungeonResult{v, DungeonError::None}; }
    static DungeonResult failure(DungeonError e) { return DungeonResult{nullptr, e}; }

    [[nodiscard]] bool ok() const { return value != nullptr && error == DungeonError::None; }
    explicit operator bool() const { return ok(); }
    T* operator->() const { return value; }
    T& operator*() const { return *value; }
};
