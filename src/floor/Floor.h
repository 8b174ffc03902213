#pragma once

#include "FloorGridLogic.h"

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// Bosses that can be stationed on a floor
enum class BossKind : uint8_t {
    DragonLord = 0,
    LichKing,
    DemonGeneral,
    AncientGolem,
    ShadowMaster
};

const char* toString(BossKind kind);

enum class OccupantKind : uint8_t {
    Monster = 0,    // Placed by the dungeon owner
    Invader = 1     // Transient visitor
};

// Character present on a floor. The floor only tracks identity and position.
struct FloorOccupant {
    entt::entity entity{entt::null};
    OccupantKind kind{OccupantKind::Monster};
    glm::vec2 position{0.0f};
};

struct BossAssignment {
    BossKind kind = BossKind::DragonLord;
    int32_t level = 1;
};

// One level of the dungeon. Floors are owned by FloorRegistry; the wall set
// is only replaced through a renovation commit.
class Floor {
public:
    Floor(int32_t index, const FloorGrid::GridCell& upStair, const FloorGrid::GridCell& downStair);

    int32_t index() const { return index_; }

    // Floor 1 has no up stair; the core floor has no down stair
    bool hasUpStair() const { return index_ > 1; }
    bool hasDownStair() const { return !hasCore_; }

    std::optional<FloorGrid::GridCell> upStair() const;
    std::optional<FloorGrid::GridCell> downStair() const;

    // Stored positions, including the inactive stair of an edge floor
    const FloorGrid::GridCell& upStairPosition() const { return upStair_; }
    const FloorGrid::GridCell& downStairPosition() const { return downStair_; }

    // True if `position` is within one unit of either stored stair position
    bool isNearStair(const glm::vec2& position) const;

    bool hasCore() const { return hasCore_; }

    // Set while a renovation session edits this floor; stairs cannot move
    bool isLayoutLocked() const { return layoutLocked_; }

    const FloorGrid::WallSet& walls() const { return walls_; }
    bool hasWallAt(const glm::vec2& position) const;

    const std::vector<FloorOccupant>& occupants() const { return occupants_; }
    size_t monsterCount() const;
    size_t invaderCount() const;
    bool isEmpty() const { return occupants_.empty(); }
    bool contains(entt::entity entity) const;

    const std::optional<BossAssignment>& boss() const { return boss_; }
    bool isBossFloor() const { return boss_.has_value(); }

private:
    friend class FloorRegistry;

    void setCore(bool hasCore) { hasCore_ = hasCore; }
    void setLayoutLocked(bool locked) { layoutLocked_ = locked; }
    void setStairPositions(const FloorGrid::GridCell& upStair, const FloorGrid::GridCell& downStair);
    void replaceWalls(FloorGrid::WallSet walls) { walls_ = std::move(walls); }

    bool addOccupant(const FloorOccupant& occupant);
    bool removeOccupant(entt::entity entity);
    bool moveOccupant(entt::entity entity, const glm::vec2& position);

    void setBoss(BossKind kind, int32_t level) { boss_ = BossAssignment{kind, level}; }
    void clearBoss() { boss_.reset(); }

    int32_t index_;
    FloorGrid::GridCell upStair_;
    FloorGrid::GridCell downStair_;
    bool hasCore_ = false;
    bool layoutLocked_ = false;

    FloorGrid::WallSet walls_;
    std::vector<FloorOccupant> occupants_;
    std::optional<BossAssignment> boss_;
};
