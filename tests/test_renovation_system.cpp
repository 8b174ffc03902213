// Tests for RenovationSystem - sessions, wall placement and stair connectivity

#include <doctest/doctest.h>
#include "renovation/RenovationSystem.h"
#include "floor/FloorRegistry.h"
#include "ecs/World.h"

#include <string>
#include <vector>

namespace {

// Registry with a middle floor whose stairs sit at (0,0) and (5,5)
struct RenovationFixture {
    DungeonEventDispatcher events;
    FloorRegistry floors{FloorConfig{}, events};
    RenovationSystem renovation{floors, RenovationConfig{}, events};
    std::vector<DungeonEvent> received;

    RenovationFixture() {
        CHECK(floors.setStairPositions(2, {0, 0}, {5, 5}) == DungeonError::None);
        events.addListener([this](const DungeonEvent& e) { received.push_back(e); });
    }

    size_t count(const std::string& name) const {
        size_t n = 0;
        for (const auto& e : received) {
            if (e.name == name) n++;
        }
        return n;
    }
};

} // namespace

TEST_SUITE("RenovationSystem sessions") {
    TEST_CASE("session starts on an empty floor with a copy of its walls") {
        RenovationFixture f;
        REQUIRE(f.floors.commitWalls(2, FloorGrid::WallSet{{2, 2}}) == DungeonError::None);

        CHECK(f.renovation.canStartRenovation(2));
        CHECK(f.renovation.startRenovation(2) == DungeonError::None);
        CHECK(f.renovation.isActive());
        CHECK(f.renovation.activeFloor() == 2);
        CHECK(f.renovation.workingWalls().size() == 1);
        CHECK(f.count(DungeonEvents::RENOVATION_STARTED) == 1);
    }

    TEST_CASE("only one session at a time") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        CHECK(f.renovation.startRenovation(1) == DungeonError::SessionActive);
        CHECK(f.renovation.activeFloor() == 2);
    }

    TEST_CASE("missing floor is an invalid index") {
        RenovationFixture f;
        CHECK_FALSE(f.renovation.canStartRenovation(8));
        CHECK(f.renovation.startRenovation(8) == DungeonError::InvalidIndex);
        CHECK_FALSE(f.renovation.isActive());
    }

    TEST_CASE("occupied floor cannot be renovated") {
        RenovationFixture f;
        ecs::World world;
        auto invader = world.createInvader(InvaderKind::Warrior);
        REQUIRE(f.floors.addInvader(2, invader, {1.0f, 3.0f}) == DungeonError::None);

        CHECK_FALSE(f.renovation.canStartRenovation(2));
        CHECK(f.renovation.startRenovation(2) == DungeonError::OccupiedFloor);
        CHECK_FALSE(f.renovation.isActive());

        REQUIRE(f.count(DungeonEvents::RENOVATION_ERROR) == 1);
        CHECK(f.received.back().message == std::string(describe(DungeonError::OccupiedFloor)));
    }

    TEST_CASE("edits outside a session are rejected") {
        RenovationFixture f;
        CHECK(f.renovation.placeWall({2, 2}) == DungeonError::NotInSession);
        CHECK(f.renovation.removeWall({2, 2}) == DungeonError::NotInSession);
        CHECK(f.renovation.endRenovation() == DungeonError::NotInSession);
        CHECK_FALSE(f.renovation.validateStairPath());
    }

    TEST_CASE("saving commits the working walls") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({3, 1}) == DungeonError::None);

        CHECK(f.floors.getFloor(2)->walls().empty());

        CHECK(f.renovation.endRenovation(true) == DungeonError::None);
        CHECK_FALSE(f.renovation.isActive());
        CHECK(f.floors.getFloor(2)->walls().size() == 2);
        CHECK(f.count(DungeonEvents::LAYOUT_SAVED) == 1);
        CHECK(f.count(DungeonEvents::RENOVATION_ENDED) == 1);
    }

    TEST_CASE("discarding leaves the committed walls alone") {
        RenovationFixture f;
        REQUIRE(f.floors.commitWalls(2, FloorGrid::WallSet{{2, 2}}) == DungeonError::None);
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.removeWall({2, 2}) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({3, 1}) == DungeonError::None);

        CHECK(f.renovation.endRenovation(false) == DungeonError::None);
        const auto& walls = f.floors.getFloor(2)->walls();
        CHECK(walls.size() == 1);
        CHECK(walls.count({2, 2}) == 1);
        CHECK(f.count(DungeonEvents::LAYOUT_SAVED) == 0);
    }

    TEST_CASE("reset drops the session without saving") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);

        f.renovation.resetRenovation();
        CHECK_FALSE(f.renovation.isActive());
        CHECK(f.renovation.workingWalls().empty());
        CHECK(f.floors.getFloor(2)->walls().empty());

        // Reset without a session is harmless
        f.renovation.resetRenovation();
        CHECK_FALSE(f.renovation.isActive());
    }
}

TEST_SUITE("RenovationSystem walls") {
    TEST_CASE("wall next to the stairs is accepted") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);

        CHECK(f.renovation.placeWall({2, 2}) == DungeonError::None);
        CHECK(f.renovation.workingWalls().count({2, 2}) == 1);
        CHECK(f.renovation.lastSearch().found);
        CHECK(f.count(DungeonEvents::WALL_PLACED) == 1);
        CHECK(f.received.back().cell == FloorGrid::GridCell{2, 2});
    }

    TEST_CASE("walls on a stair are rejected") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);

        CHECK(f.renovation.placeWall({0, 0}) == DungeonError::StairClearance);
        CHECK(f.renovation.placeWall({5, 5}) == DungeonError::StairClearance);
        CHECK(f.renovation.workingWalls().empty());

        // Exactly one unit away is allowed
        CHECK(f.renovation.placeWall({1, 0}) == DungeonError::None);
    }

    TEST_CASE("duplicate wall is rejected") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);
        CHECK(f.renovation.placeWall({2, 2}) == DungeonError::AlreadyWalled);
        CHECK(f.renovation.workingWalls().size() == 1);
    }

    TEST_CASE("removing a missing wall reports NoWall") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        CHECK(f.renovation.removeWall({7, 7}) == DungeonError::NoWall);
    }

    TEST_CASE("closing the last gap in a column is blocked and rolled back") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);

        for (int32_t y = -10; y <= 9; ++y) {
            REQUIRE(f.renovation.placeWall({3, y}) == DungeonError::None);
        }
        FloorGrid::WallSet before = f.renovation.workingWalls();

        CHECK(f.renovation.placeWall({3, 10}) == DungeonError::PathBlocked);
        CHECK(f.renovation.workingWalls() == before);
        CHECK(f.renovation.validateStairPath());

        CHECK(f.count(DungeonEvents::RENOVATION_ERROR) == 1);
        CHECK(f.received.back().message == std::string(describe(DungeonError::PathBlocked)));
    }

    TEST_CASE("removing a wall reopens the path") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        for (int32_t y = -10; y <= 9; ++y) {
            REQUIRE(f.renovation.placeWall({3, y}) == DungeonError::None);
        }
        REQUIRE(f.renovation.placeWall({3, 10}) == DungeonError::PathBlocked);

        CHECK(f.renovation.removeWall({3, 0}) == DungeonError::None);
        CHECK(f.renovation.placeWall({3, 10}) == DungeonError::None);
        CHECK(f.renovation.validateStairPath());
    }

    TEST_CASE("top floor and core floor always validate") {
        RenovationFixture f;

        // Floor 1 only has a down stair; a column that would cut it off is fine
        REQUIRE(f.renovation.startRenovation(1) == DungeonError::None);
        for (int32_t y = -10; y <= 10; ++y) {
            CHECK(f.renovation.placeWall({0, y}) == DungeonError::None);
        }
        CHECK(f.renovation.validateStairPath());
        REQUIRE(f.renovation.endRenovation(true) == DungeonError::None);

        REQUIRE(f.renovation.startRenovation(3) == DungeonError::None);
        for (int32_t y = -10; y <= 10; ++y) {
            CHECK(f.renovation.placeWall({0, y}) == DungeonError::None);
        }
        CHECK(f.renovation.validateStairPath());
    }

    TEST_CASE("both stored stairs stay protected on edge floors") {
        RenovationFixture f;

        // The core floor has no active down stair but its stored position is kept clear
        REQUIRE(f.renovation.startRenovation(3) == DungeonError::None);
        CHECK(f.renovation.placeWall({4, -4}) == DungeonError::StairClearance);
        REQUIRE(f.renovation.endRenovation(true) == DungeonError::None);

        // So expanding leaves floor 3 with a clear down stair
        REQUIRE(f.floors.expand());
        const Floor* former = f.floors.getFloor(3);
        REQUIRE(former->downStair().has_value());
        CHECK(former->walls().count(*former->downStair()) == 0);
    }

    TEST_CASE("edit validation can be switched off") {
        DungeonEventDispatcher events;
        FloorRegistry floors(FloorConfig{}, events);
        RenovationConfig config;
        config.validatePathOnEdit = false;
        RenovationSystem renovation(floors, config, events);

        REQUIRE(renovation.startRenovation(2) == DungeonError::None);
        for (int32_t y = -10; y <= 10; ++y) {
            CHECK(renovation.placeWall({0, y}) == DungeonError::None);
        }
        CHECK_FALSE(renovation.validateStairPath());
    }

    TEST_CASE("configured node budget caps the search") {
        DungeonEventDispatcher events;
        FloorRegistry floors(FloorConfig{}, events);
        RenovationConfig config;
        config.maxNodeExpansions = 3;
        RenovationSystem renovation(floors, config, events);

        REQUIRE(renovation.startRenovation(2) == DungeonError::None);
        CHECK(renovation.placeWall({0, 0}) == DungeonError::PathBlocked);
        CHECK(renovation.lastSearch().budgetExhausted);
        CHECK(renovation.workingWalls().empty());
    }
}

TEST_SUITE("RenovationSystem layout lock") {
    TEST_CASE("stairs cannot move onto a working wall") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({1, 1}) == DungeonError::None);

        CHECK(f.floors.setStairPositions(2, {1, 1}, {5, 5}) == DungeonError::SessionActive);
        CHECK(*f.floors.getFloor(2)->upStair() == FloorGrid::GridCell{0, 0});

        // The layout still saves intact
        CHECK(f.renovation.endRenovation(true) == DungeonError::None);
        CHECK(f.floors.getFloor(2)->walls().count({1, 1}) == 1);
        CHECK(f.count(DungeonEvents::LAYOUT_SAVED) == 1);
    }

    TEST_CASE("the lock is released when the session ends") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        CHECK(f.floors.getFloor(2)->isLayoutLocked());

        REQUIRE(f.renovation.endRenovation(false) == DungeonError::None);
        CHECK_FALSE(f.floors.getFloor(2)->isLayoutLocked());
        CHECK(f.floors.setStairPositions(2, {1, 1}, {5, 5}) == DungeonError::None);

        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        f.renovation.resetRenovation();
        CHECK_FALSE(f.floors.getFloor(2)->isLayoutLocked());
    }

    TEST_CASE("other floors keep movable stairs during a session") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        CHECK(f.floors.setStairPositions(3, {1, 1}, {6, 6}) == DungeonError::None);
    }
}

TEST_SUITE("RenovationSystem auto-save") {
    TEST_CASE("an arriving occupant ends the session and saves") {
        RenovationFixture f;
        ecs::World world;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);

        auto monster = world.createMonster(MonsterKind::Goblin);
        REQUIRE(f.floors.placeMonster(2, monster, {-3.0f, 2.0f}) == DungeonError::None);

        CHECK_FALSE(f.renovation.isActive());
        CHECK(f.floors.getFloor(2)->walls().count({2, 2}) == 1);
        CHECK(f.count(DungeonEvents::LAYOUT_SAVED) == 1);
    }

    TEST_CASE("an arrival on another floor does not interrupt") {
        RenovationFixture f;
        ecs::World world;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);

        auto invader = world.createInvader(InvaderKind::Mage);
        REQUIRE(f.floors.addInvader(1, invader, {0.0f, 0.0f}) == DungeonError::None);
        CHECK(f.renovation.isActive());
    }

    TEST_CASE("viewing another floor ends the session") {
        RenovationFixture f;
        REQUIRE(f.renovation.startRenovation(2) == DungeonError::None);
        REQUIRE(f.renovation.placeWall({2, 2}) == DungeonError::None);

        REQUIRE(f.floors.changeViewFloor(2) == DungeonError::None);
        CHECK(f.renovation.isActive());

        REQUIRE(f.floors.changeViewFloor(3) == DungeonError::None);
        CHECK_FALSE(f.renovation.isActive());
        CHECK(f.floors.getFloor(2)->walls().count({2, 2}) == 1);
    }
}
