#pragma once

#include "config/DungeonConfig.h"
#include "core/DungeonError.h"
#include "core/DungeonEvent.h"
#include "floor/FloorGridLogic.h"

#include <cstdint>

class FloorRegistry;

// RenovationSystem runs exclusive, floor-scoped wall editing sessions.
//
// Key concepts:
// - A session can only start on an empty floor
// - Edits go to a working copy of the floor's walls
// - A wall is only kept if the stairs stay connected (rollback on reject)
// - Saving commits the working set back to the FloorRegistry
// - An arriving occupant or a view change away ends the session (auto-save)
// - The floor's layout is locked while the session runs, so stairs stay put
class RenovationSystem {
public:
    RenovationSystem(FloorRegistry& floors, const RenovationConfig& config, DungeonEventDispatcher& events);
    ~RenovationSystem();

    RenovationSystem(const RenovationSystem&) = delete;
    RenovationSystem& operator=(const RenovationSystem&) = delete;

    bool canStartRenovation(int32_t floorIndex) const;
    DungeonError startRenovation(int32_t floorIndex);

    // Ends the session; `save` commits the working walls, otherwise they are dropped.
    // A failed commit returns its error and leaves the session open.
    DungeonError endRenovation(bool save = true);

    // Drops any running session without saving
    void resetRenovation();

    DungeonError placeWall(const FloorGrid::GridCell& cell);
    DungeonError removeWall(const FloorGrid::GridCell& cell);

    // Stair connectivity over the working walls. Floor 1 and the core floor
    // always pass; outside a session this is false.
    bool validateStairPath() const;

    bool isActive() const { return activeFloor_ > 0; }
    int32_t activeFloor() const { return activeFloor_; }
    const FloorGrid::WallSet& workingWalls() const { return workingWalls_; }

    // Stats of the most recent connectivity search
    const FloorGrid::PathSearchResult& lastSearch() const { return lastSearch_; }

private:
    void onEvent(const DungeonEvent& event);
    void autoSave();
    void reportError(DungeonError error);
    void emit(const char* name, const FloorGrid::GridCell& cell = FloorGrid::GridCell{});

    FloorRegistry& floors_;
    RenovationConfig config_;
    DungeonEventDispatcher& events_;
    uint32_t listenerId_ = 0;

    int32_t activeFloor_ = 0;   // 0 = no session
    FloorGrid::WallSet workingWalls_;
    mutable FloorGrid::PathSearchResult lastSearch_;
};
