#pragma once

// Pure floor grid logic - no ECS or engine dependencies
// Shared by the floor registry, renovation and tests

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_set>

namespace FloorGrid {

// Cell coordinate on a floor
struct GridCell {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const GridCell& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    GridCell operator+(const GridCell& other) const {
        return GridCell{x + other.x, y + other.y};
    }

    glm::vec2 toVec2() const {
        return glm::vec2(static_cast<float>(x), static_cast<float>(y));
    }
};

// Hash function for GridCell to use in unordered containers
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int64_t>()(static_cast<int64_t>(cell.x) << 32 | static_cast<uint32_t>(cell.y));
    }
};

using WallSet = std::unordered_set<GridCell, GridCellHash>;

// Inclusive rectangular extent of a floor
struct GridBounds {
    int32_t minX = -10;
    int32_t maxX = 10;
    int32_t minY = -10;
    int32_t maxY = 10;

    bool contains(const GridCell& cell) const {
        return cell.x >= minX && cell.x <= maxX &&
               cell.y >= minY && cell.y <= maxY;
    }

    uint32_t cellCount() const {
        if (maxX < minX || maxY < minY) return 0;
        return static_cast<uint32_t>(maxX - minX + 1) * static_cast<uint32_t>(maxY - minY + 1);
    }
};

// 8-connected neighbourhood (orthogonal first, then diagonals)
inline constexpr std::array<GridCell, 8> kNeighbourOffsets = {{
    {0, 1}, {0, -1}, {-1, 0}, {1, 0},
    {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
}};

inline float distance(const glm::vec2& a, const glm::vec2& b) {
    return glm::length(a - b);
}

// True if two positions are closer than one grid unit
inline bool withinOneUnit(const glm::vec2& a, const glm::vec2& b) {
    return distance(a, b) < 1.0f;
}

inline bool withinOneUnit(const GridCell& a, const GridCell& b) {
    return withinOneUnit(a.toVec2(), b.toVec2());
}

struct PathSearchResult {
    bool found = false;
    uint32_t nodesExpanded = 0;
    bool budgetExhausted = false;
};

// Node budget that guarantees the search completes: every cell is enqueued
// at most once, so the dequeue count never exceeds the cell count (+1 for a
// start outside the bounds).
inline uint32_t defaultNodeBudget(const GridBounds& bounds) {
    return bounds.cellCount() + 1;
}

// Breadth-first reachability from start to goal over the 8-connected grid.
// Cells in `walls` and cells outside `bounds` are impassable. The search gives
// up after `nodeBudget` dequeues; an exhausted search counts as no path.
inline PathSearchResult findPath(const GridCell& start, const GridCell& goal,
                                 const WallSet& walls, const GridBounds& bounds,
                                 uint32_t nodeBudget) {
    PathSearchResult result;

    std::queue<GridCell> frontier;
    std::unordered_set<GridCell, GridCellHash> visited;

    frontier.push(start);
    visited.insert(start);

    while (!frontier.empty()) {
        if (result.nodesExpanded >= nodeBudget) {
            result.budgetExhausted = true;
            return result;
        }

        GridCell current = frontier.front();
        frontier.pop();
        result.nodesExpanded++;

        if (withinOneUnit(current, goal)) {
            result.found = true;
            return result;
        }

        for (const auto& offset : kNeighbourOffsets) {
            GridCell next = current + offset;

            if (!bounds.contains(next)) continue;
            if (visited.count(next) > 0 || walls.count(next) > 0) continue;

            visited.insert(next);
            frontier.push(next);
        }
    }

    return result;
}

inline bool hasPath(const GridCell& start, const GridCell& goal,
                    const WallSet& walls, const GridBounds& bounds,
                    uint32_t nodeBudget) {
    return findPath(start, goal, walls, bounds, nodeBudget).found;
}

} // namespace FloorGrid
