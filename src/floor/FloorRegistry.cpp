#include "FloorRegistry.h"

#include <SDL3/SDL_log.h>
#include <cmath>
#include <limits>

FloorRegistry::FloorRegistry(const FloorConfig& config, DungeonEventDispatcher& events)
    : config_(config), events_(events) {
    for (int32_t i = 1; i <= config_.initialFloorCount; ++i) {
        FloorResult result = createFloor(i);
        if (!result) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Failed to create initial floor %d: %s",
                         i, toString(result.error));
            break;
        }
    }

    SDL_Log("FloorRegistry: Initialized with %d floors (max %d)", floorCount(), config_.maxFloors);
}

FloorResult FloorRegistry::createFloor(int32_t index) {
    if (index <= 0 || index > config_.maxFloors) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Invalid floor index: %d", index);
        return FloorResult::failure(DungeonError::InvalidIndex);
    }

    if (Floor* existing = getFloor(index)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Floor %d already exists", index);
        return FloorResult::success(existing);
    }

    // Floors stay contiguous: only the next index can be created
    if (index != floorCount() + 1) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "FloorRegistry: Floor %d would leave a gap after floor %d", index, floorCount());
        return FloorResult::failure(DungeonError::InvalidIndex);
    }

    auto floor = std::make_unique<Floor>(index, config_.defaultUpStair, config_.defaultDownStair);

    // The new floor is the deepest, so the core moves onto it
    if (!floors_.empty()) {
        floors_.back()->setCore(false);
    }
    floor->setCore(true);

    Floor* created = floor.get();
    floors_.push_back(std::move(floor));

    emit(DungeonEvents::FLOOR_CREATED, index);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Created floor %d", index);

    return FloorResult::success(created);
}

FloorResult FloorRegistry::expand() {
    if (!canExpand()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Cannot expand, maximum floors (%d) reached",
                    config_.maxFloors);
        return FloorResult::failure(DungeonError::MaxFloorsReached);
    }

    int32_t newIndex = floorCount() + 1;
    FloorResult result = createFloor(newIndex);
    if (!result) {
        return result;
    }

    emit(DungeonEvents::FLOOR_EXPANDED, newIndex);
    SDL_Log("FloorRegistry: Expanded to floor %d", newIndex);
    return result;
}

Floor* FloorRegistry::getFloor(int32_t index) {
    if (index <= 0 || index > floorCount()) return nullptr;
    return floors_[static_cast<size_t>(index - 1)].get();
}

const Floor* FloorRegistry::getFloor(int32_t index) const {
    if (index <= 0 || index > floorCount()) return nullptr;
    return floors_[static_cast<size_t>(index - 1)].get();
}

const Floor* FloorRegistry::coreFloor() const {
    return floors_.empty() ? nullptr : floors_.back().get();
}

bool FloorRegistry::isEmpty(int32_t index) const {
    const Floor* floor = getFloor(index);
    return floor == nullptr || floor->isEmpty();
}

int32_t FloorRegistry::expansionCost(int32_t targetFloor) const {
    if (targetFloor <= config_.freeFloors) {
        return 0;
    }

    double cost = static_cast<double>(config_.expansionBaseCost) *
                  std::pow(static_cast<double>(config_.expansionCostMultiplier),
                           static_cast<double>(targetFloor - config_.freeFloors));

    // Deep floors saturate instead of overflowing
    constexpr double maxCost = static_cast<double>(std::numeric_limits<int32_t>::max());
    if (!(cost < maxCost)) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(std::llround(cost));
}

bool FloorRegistry::canPlaceMonster(int32_t index, const glm::vec2& position) const {
    const Floor* floor = getFloor(index);
    if (!floor) return false;

    if (floor->isNearStair(position)) return false;
    if (floor->hasWallAt(position)) return false;

    for (const auto& occupant : floor->occupants()) {
        if (occupant.kind == OccupantKind::Monster &&
            FloorGrid::withinOneUnit(position, occupant.position)) {
            return false;
        }
    }

    return floor->monsterCount() < static_cast<size_t>(config_.maxMonstersPerFloor);
}

DungeonError FloorRegistry::placeMonster(int32_t index, entt::entity monster, const glm::vec2& position) {
    if (!getFloor(index)) {
        return DungeonError::InvalidIndex;
    }
    if (!canPlaceMonster(index, position)) {
        return DungeonError::PlacementBlocked;
    }

    DungeonError error = addOccupant(index, FloorOccupant{monster, OccupantKind::Monster, position});
    if (error == DungeonError::None) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Placed monster on floor %d at (%.1f, %.1f)",
                     index, position.x, position.y);
    }
    return error;
}

DungeonError FloorRegistry::addInvader(int32_t index, entt::entity invader, const glm::vec2& position) {
    if (!getFloor(index)) {
        return DungeonError::InvalidIndex;
    }
    return addOccupant(index, FloorOccupant{invader, OccupantKind::Invader, position});
}

DungeonError FloorRegistry::addOccupant(int32_t index, const FloorOccupant& occupant) {
    // An entity occupies at most one floor
    if (floorOf(occupant.entity) != 0) {
        return DungeonError::PlacementBlocked;
    }

    Floor* floor = getFloor(index);
    if (!floor->addOccupant(occupant)) {
        return DungeonError::PlacementBlocked;
    }

    emit(DungeonEvents::OCCUPANT_ARRIVED, index);
    return DungeonError::None;
}

bool FloorRegistry::removeOccupant(entt::entity entity) {
    for (auto& floor : floors_) {
        if (floor->removeOccupant(entity)) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Removed occupant from floor %d",
                         floor->index());
            return true;
        }
    }
    return false;
}

bool FloorRegistry::updateOccupantPosition(entt::entity entity, const glm::vec2& position) {
    for (auto& floor : floors_) {
        if (floor->moveOccupant(entity, position)) return true;
    }
    return false;
}

int32_t FloorRegistry::floorOf(entt::entity entity) const {
    for (const auto& floor : floors_) {
        if (floor->contains(entity)) return floor->index();
    }
    return 0;
}

DungeonError FloorRegistry::commitWalls(int32_t index, const FloorGrid::WallSet& walls) {
    Floor* floor = getFloor(index);
    if (!floor) {
        return DungeonError::InvalidIndex;
    }

    for (const auto& wall : walls) {
        if (floor->isNearStair(wall.toVec2())) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "FloorRegistry: Rejected layout for floor %d, wall at (%d, %d) covers a stair",
                         index, wall.x, wall.y);
            return DungeonError::StairClearance;
        }
    }

    floor->replaceWalls(walls);
    return DungeonError::None;
}

DungeonError FloorRegistry::setLayoutLocked(int32_t index, bool locked) {
    Floor* floor = getFloor(index);
    if (!floor) {
        return DungeonError::InvalidIndex;
    }

    floor->setLayoutLocked(locked);
    return DungeonError::None;
}

DungeonError FloorRegistry::setStairPositions(int32_t index, const FloorGrid::GridCell& upStair,
                                              const FloorGrid::GridCell& downStair) {
    Floor* floor = getFloor(index);
    if (!floor) {
        return DungeonError::InvalidIndex;
    }

    if (floor->isLayoutLocked()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "FloorRegistry: Cannot move stairs on floor %d during renovation", index);
        return DungeonError::SessionActive;
    }

    for (const auto& wall : floor->walls()) {
        if (FloorGrid::withinOneUnit(wall, upStair) || FloorGrid::withinOneUnit(wall, downStair)) {
            return DungeonError::StairClearance;
        }
    }

    floor->setStairPositions(upStair, downStair);
    return DungeonError::None;
}

DungeonError FloorRegistry::setBoss(int32_t index, BossKind kind, int32_t level) {
    Floor* floor = getFloor(index);
    if (!floor) {
        return DungeonError::InvalidIndex;
    }

    floor->setBoss(kind, level);
    SDL_Log("FloorRegistry: Stationed %s (level %d) on floor %d", toString(kind), level, index);
    return DungeonError::None;
}

DungeonError FloorRegistry::removeBoss(int32_t index) {
    Floor* floor = getFloor(index);
    if (!floor) {
        return DungeonError::InvalidIndex;
    }

    floor->clearBoss();
    return DungeonError::None;
}

DungeonError FloorRegistry::changeViewFloor(int32_t index) {
    if (index < 1 || index > floorCount()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "FloorRegistry: Invalid floor index for view: %d", index);
        return DungeonError::InvalidIndex;
    }

    viewFloor_ = index;
    emit(DungeonEvents::VIEW_FLOOR_CHANGED, index);
    return DungeonError::None;
}

DungeonError FloorRegistry::moveToUpperFloor() {
    return changeViewFloor(viewFloor_ - 1);
}

DungeonError FloorRegistry::moveToLowerFloor() {
    return changeViewFloor(viewFloor_ + 1);
}

void FloorRegistry::emit(const char* name, int32_t floorIndex) {
    DungeonEvent event;
    event.name = name;
    event.floorIndex = floorIndex;
    events_.dispatch(event);
}
