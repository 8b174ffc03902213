#include "Floor.h"

#include <algorithm>

const char* toString(BossKind kind) {
    switch (kind) {
        case BossKind::DragonLord:   return "DragonLord";
        case BossKind::LichKing:     return "LichKing";
        case BossKind::DemonGeneral: return "DemonGeneral";
        case BossKind::AncientGolem: return "AncientGolem";
        case BossKind::ShadowMaster: return "ShadowMaster";
    }
    return "Unknown";
}

Floor::Floor(int32_t index, const FloorGrid::GridCell& upStair, const FloorGrid::GridCell& downStair)
    : index_(index), upStair_(upStair), downStair_(downStair) {}

std::optional<FloorGrid::GridCell> Floor::upStair() const {
    if (!hasUpStair()) return std::nullopt;
    return upStair_;
}

std::optional<FloorGrid::GridCell> Floor::downStair() const {
    if (!hasDownStair()) return std::nullopt;
    return downStair_;
}

void Floor::setStairPositions(const FloorGrid::GridCell& upStair, const FloorGrid::GridCell& downStair) {
    upStair_ = upStair;
    downStair_ = downStair;
}

bool Floor::isNearStair(const glm::vec2& position) const {
    return FloorGrid::withinOneUnit(position, upStair_.toVec2()) ||
           FloorGrid::withinOneUnit(position, downStair_.toVec2());
}

bool Floor::hasWallAt(const glm::vec2& position) const {
    for (const auto& wall : walls_) {
        if (FloorGrid::withinOneUnit(position, wall.toVec2())) return true;
    }
    return false;
}

size_t Floor::monsterCount() const {
    return static_cast<size_t>(std::count_if(occupants_.begin(), occupants_.end(),
        [](const FloorOccupant& o) { return o.kind == OccupantKind::Monster; }));
}

size_t Floor::invaderCount() const {
    return static_cast<size_t>(std::count_if(occupants_.begin(), occupants_.end(),
        [](const FloorOccupant& o) { return o.kind == OccupantKind::Invader; }));
}

bool Floor::contains(entt::entity entity) const {
    return std::any_of(occupants_.begin(), occupants_.end(),
        [entity](const FloorOccupant& o) { return o.entity == entity; });
}

bool Floor::addOccupant(const FloorOccupant& occupant) {
    if (occupant.entity == entt::null || contains(occupant.entity)) return false;
    occupants_.push_back(occupant);
    return true;
}

bool Floor::removeOccupant(entt::entity entity) {
    auto it = std::find_if(occupants_.begin(), occupants_.end(),
        [entity](const FloorOccupant& o) { return o.entity == entity; });
    if (it == occupants_.end()) return false;
    occupants_.erase(it);
    return true;
}

bool Floor::moveOccupant(entt::entity entity, const glm::vec2& position) {
    for (auto& occupant : occupants_) {
        if (occupant.entity == entity) {
            occupant.position = position;
            return true;
        }
    }
    return false;
}
