#pragma once

#include "Floor.h"
#include "config/DungeonConfig.h"
#include "core/DungeonError.h"
#include "core/DungeonEvent.h"

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <memory>
#include <vector>

using FloorResult = DungeonResult<Floor>;

// FloorRegistry owns the ordered list of dungeon floors.
//
// Key concepts:
// - Floors are 1-based and contiguous; they are never destroyed
// - Exactly one floor carries the core, always the deepest one
// - Expansion appends a floor and moves the core onto it
// - Occupancy changes are announced so renovation can stop on arrival
class FloorRegistry {
public:
    FloorRegistry(const FloorConfig& config, DungeonEventDispatcher& events);

    FloorRegistry(const FloorRegistry&) = delete;
    FloorRegistry& operator=(const FloorRegistry&) = delete;

    // Create the floor at `index`. Returns the existing floor if present.
    FloorResult createFloor(int32_t index);

    // Append floor count+1 and move the core onto it
    FloorResult expand();

    Floor* getFloor(int32_t index);
    const Floor* getFloor(int32_t index) const;

    // Floor with the core (the deepest floor), nullptr before initialization
    const Floor* coreFloor() const;

    // A missing floor counts as empty
    bool isEmpty(int32_t index) const;

    int32_t floorCount() const { return static_cast<int32_t>(floors_.size()); }
    int32_t maxFloors() const { return config_.maxFloors; }
    bool canExpand() const { return floorCount() < config_.maxFloors; }

    // Gold cost of digging `targetFloor`
    int32_t expansionCost(int32_t targetFloor) const;

    const std::vector<std::unique_ptr<Floor>>& floors() const { return floors_; }

    // -------------------------------------------------------------------------
    // Occupancy
    // -------------------------------------------------------------------------

    bool canPlaceMonster(int32_t index, const glm::vec2& position) const;
    DungeonError placeMonster(int32_t index, entt::entity monster, const glm::vec2& position);
    DungeonError addInvader(int32_t index, entt::entity invader, const glm::vec2& position);

    // Removes the entity from whichever floor holds it
    bool removeOccupant(entt::entity entity);
    bool updateOccupantPosition(entt::entity entity, const glm::vec2& position);

    // Index of the floor holding the entity, 0 if none
    int32_t floorOf(entt::entity entity) const;

    // -------------------------------------------------------------------------
    // Layout
    // -------------------------------------------------------------------------

    // Replace the committed wall set (renovation commit)
    DungeonError commitWalls(int32_t index, const FloorGrid::WallSet& walls);

    // Lock or unlock a floor's layout for a renovation session
    DungeonError setLayoutLocked(int32_t index, bool locked);

    // Move the stairs of a floor; rejected if a wall sits on either cell
    // or the layout is locked (SessionActive)
    DungeonError setStairPositions(int32_t index, const FloorGrid::GridCell& upStair,
                                   const FloorGrid::GridCell& downStair);

    DungeonError setBoss(int32_t index, BossKind kind, int32_t level);
    DungeonError removeBoss(int32_t index);

    // -------------------------------------------------------------------------
    // View floor
    // -------------------------------------------------------------------------

    int32_t viewFloor() const { return viewFloor_; }
    DungeonError changeViewFloor(int32_t index);
    DungeonError moveToUpperFloor();
    DungeonError moveToLowerFloor();

    DungeonEventDispatcher& events() { return events_; }

private:
    DungeonError addOccupant(int32_t index, const FloorOccupant& occupant);
    void emit(const char* name, int32_t floorIndex);

    FloorConfig config_;
    DungeonEventDispatcher& events_;

    // Sorted by index; index i lives at floors_[i - 1]
    std::vector<std::unique_ptr<Floor>> floors_;
    int32_t viewFloor_ = 1;
};
