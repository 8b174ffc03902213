#include "RenovationSystem.h"
#include "floor/FloorRegistry.h"

#include <SDL3/SDL_log.h>

RenovationSystem::RenovationSystem(FloorRegistry& floors, const RenovationConfig& config,
                                   DungeonEventDispatcher& events)
    : floors_(floors), config_(config), events_(events) {
    listenerId_ = events_.addListener([this](const DungeonEvent& event) { onEvent(event); });
    SDL_Log("RenovationSystem: Initialized (grid [%d,%d]x[%d,%d], node budget %u)",
            config_.bounds.minX, config_.bounds.maxX, config_.bounds.minY, config_.bounds.maxY,
            config_.nodeBudget());
}

RenovationSystem::~RenovationSystem() {
    events_.removeListener(listenerId_);
}

bool RenovationSystem::canStartRenovation(int32_t floorIndex) const {
    if (!floors_.getFloor(floorIndex)) {
        return false;
    }

    bool empty = floors_.isEmpty(floorIndex);
    if (!empty) {
        SDL_Log("RenovationSystem: Cannot renovate floor %d, floor is not empty", floorIndex);
    }
    return empty;
}

DungeonError RenovationSystem::startRenovation(int32_t floorIndex) {
    if (isActive()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "RenovationSystem: Renovation already active on floor %d",
                    activeFloor_);
        reportError(DungeonError::SessionActive);
        return DungeonError::SessionActive;
    }

    const Floor* floor = floors_.getFloor(floorIndex);
    if (!floor) {
        reportError(DungeonError::InvalidIndex);
        return DungeonError::InvalidIndex;
    }

    if (!canStartRenovation(floorIndex)) {
        reportError(DungeonError::OccupiedFloor);
        return DungeonError::OccupiedFloor;
    }

    DungeonError locked = floors_.setLayoutLocked(floorIndex, true);
    if (locked != DungeonError::None) {
        reportError(locked);
        return locked;
    }

    activeFloor_ = floorIndex;
    workingWalls_ = floor->walls();

    emit(DungeonEvents::RENOVATION_STARTED);
    SDL_Log("RenovationSystem: Started renovation on floor %d (%zu walls)", floorIndex, workingWalls_.size());
    return DungeonError::None;
}

DungeonError RenovationSystem::endRenovation(bool save) {
    if (!isActive()) {
        return DungeonError::NotInSession;
    }

    int32_t renovatedFloor = activeFloor_;

    if (save) {
        DungeonError error = floors_.commitWalls(renovatedFloor, workingWalls_);
        if (error != DungeonError::None) {
            // The session stays open so the working walls are not lost
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RenovationSystem: Failed to save layout for floor %d: %s",
                         renovatedFloor, toString(error));
            reportError(error);
            return error;
        }
        emit(DungeonEvents::LAYOUT_SAVED);
        SDL_Log("RenovationSystem: Saved %zu walls for floor %d", workingWalls_.size(), renovatedFloor);
    }

    // Clear the session before notifying so listeners see it closed
    workingWalls_.clear();
    activeFloor_ = 0;

    DungeonError unlocked = floors_.setLayoutLocked(renovatedFloor, false);
    if (unlocked != DungeonError::None) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "RenovationSystem: Could not unlock floor %d: %s",
                    renovatedFloor, toString(unlocked));
    }

    DungeonEvent event;
    event.name = DungeonEvents::RENOVATION_ENDED;
    event.floorIndex = renovatedFloor;
    events_.dispatch(event);

    SDL_Log("RenovationSystem: Ended renovation on floor %d (%s)", renovatedFloor, save ? "saved" : "discarded");
    return DungeonError::None;
}

void RenovationSystem::resetRenovation() {
    if (isActive()) {
        endRenovation(false);
    }
    workingWalls_.clear();
}

DungeonError RenovationSystem::placeWall(const FloorGrid::GridCell& cell) {
    if (!isActive()) {
        reportError(DungeonError::NotInSession);
        return DungeonError::NotInSession;
    }

    const Floor* floor = floors_.getFloor(activeFloor_);
    if (!floor) {
        reportError(DungeonError::InvalidIndex);
        return DungeonError::InvalidIndex;
    }

    // Both stored stairs are protected, so the previous core floor keeps a
    // clear down stair after expansion
    if (floor->isNearStair(cell.toVec2())) {
        reportError(DungeonError::StairClearance);
        return DungeonError::StairClearance;
    }

    if (workingWalls_.count(cell) > 0) {
        return DungeonError::AlreadyWalled;
    }

    workingWalls_.insert(cell);

    if (config_.validatePathOnEdit && !validateStairPath()) {
        workingWalls_.erase(cell);
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                     "RenovationSystem: Wall at (%d, %d) rejected, stairs disconnected after %u nodes",
                     cell.x, cell.y, lastSearch_.nodesExpanded);
        reportError(DungeonError::PathBlocked);
        return DungeonError::PathBlocked;
    }

    emit(DungeonEvents::WALL_PLACED, cell);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "RenovationSystem: Placed wall at (%d, %d)", cell.x, cell.y);
    return DungeonError::None;
}

DungeonError RenovationSystem::removeWall(const FloorGrid::GridCell& cell) {
    if (!isActive()) {
        reportError(DungeonError::NotInSession);
        return DungeonError::NotInSession;
    }

    // Removing a wall can only reconnect, never disconnect
    if (workingWalls_.erase(cell) == 0) {
        return DungeonError::NoWall;
    }

    emit(DungeonEvents::WALL_REMOVED, cell);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "RenovationSystem: Removed wall at (%d, %d)", cell.x, cell.y);
    return DungeonError::None;
}

bool RenovationSystem::validateStairPath() const {
    if (!isActive()) {
        return false;
    }

    const Floor* floor = floors_.getFloor(activeFloor_);
    if (!floor) {
        return false;
    }

    auto up = floor->upStair();
    auto down = floor->downStair();

    // Edge floors have a single stair: nothing to connect
    if (!up || !down) {
        lastSearch_ = FloorGrid::PathSearchResult{true, 0, false};
        return true;
    }

    lastSearch_ = FloorGrid::findPath(*up, *down, workingWalls_, config_.bounds, config_.nodeBudget());
    if (lastSearch_.budgetExhausted) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "RenovationSystem: Path search on floor %d hit the node budget (%u)",
                    activeFloor_, config_.nodeBudget());
    }
    return lastSearch_.found;
}

void RenovationSystem::onEvent(const DungeonEvent& event) {
    if (!isActive()) return;

    if (event.name == DungeonEvents::OCCUPANT_ARRIVED && event.floorIndex == activeFloor_) {
        SDL_Log("RenovationSystem: Character arrived on floor %d, ending renovation", activeFloor_);
        autoSave();
    } else if (event.name == DungeonEvents::VIEW_FLOOR_CHANGED && event.floorIndex != activeFloor_) {
        SDL_Log("RenovationSystem: View moved to floor %d, ending renovation on floor %d",
                event.floorIndex, activeFloor_);
        autoSave();
    }
}

void RenovationSystem::autoSave() {
    if (endRenovation(true) != DungeonError::None) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "RenovationSystem: Auto-save failed on floor %d, discarding edits", activeFloor_);
        endRenovation(false);
    }
}

void RenovationSystem::reportError(DungeonError error) {
    DungeonEvent event;
    event.name = DungeonEvents::RENOVATION_ERROR;
    event.floorIndex = activeFloor_;
    event.message = describe(error);
    events_.dispatch(event);
}

void RenovationSystem::emit(const char* name, const FloorGrid::GridCell& cell) {
    DungeonEvent event;
    event.name = name;
    event.floorIndex = activeFloor_;
    event.cell = cell;
    events_.dispatch(event);
}
