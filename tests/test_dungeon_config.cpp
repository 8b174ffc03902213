// Tests for DungeonConfig - JSON loading, defaults and fallbacks

#include <doctest/doctest.h>
#include "config/DungeonConfig.h"

#include <cstdio>
#include <fstream>
#include <string>

TEST_SUITE("DungeonConfig defaults") {
    TEST_CASE("default values match the game balance") {
        DungeonConfig config;

        CHECK(config.floors.initialFloorCount == 3);
        CHECK(config.floors.maxFloors == 100);
        CHECK(config.floors.maxMonstersPerFloor == 15);
        CHECK(config.floors.defaultUpStair == FloorGrid::GridCell{-4, 4});
        CHECK(config.floors.defaultDownStair == FloorGrid::GridCell{4, -4});

        CHECK(config.renovation.bounds.minX == -10);
        CHECK(config.renovation.bounds.maxY == 10);
        CHECK(config.renovation.validatePathOnEdit);
        CHECK(config.renovation.nodeBudget() == 442);

        CHECK(config.party.maxPartiesPerFloor == 5);
        CHECK(config.party.cooperationRange == doctest::Approx(3.0f));
        CHECK(config.party.healingInterval == doctest::Approx(2.0f));
        CHECK(config.party.healingAmount == doctest::Approx(15.0f));
        CHECK(config.party.partyAttackBonus == doctest::Approx(1.2f));

        CHECK(config.recovery.floorRecoveryRate == doctest::Approx(1.0f));
        CHECK(config.recovery.shelterRecoveryRate == doctest::Approx(5.0f));
        CHECK(config.recovery.manaRecoveryMultiplier == doctest::Approx(0.8f));
    }

    TEST_CASE("explicit node budget overrides the derived one") {
        RenovationConfig config;
        config.maxNodeExpansions = 1000;
        CHECK(config.nodeBudget() == 1000);
    }
}

TEST_SUITE("DungeonConfig JSON") {
    TEST_CASE("partial JSON keeps defaults for missing keys") {
        auto config = DungeonConfig::loadFromJsonString(R"({
            "floors": { "maxFloors": 20, "upStair": { "x": -2, "y": 6 } },
            "party": { "healingAmount": 30.0 }
        })");

        CHECK(config.floors.maxFloors == 20);
        CHECK(config.floors.initialFloorCount == 3);
        CHECK(config.floors.defaultUpStair == FloorGrid::GridCell{-2, 6});
        CHECK(config.floors.defaultDownStair == FloorGrid::GridCell{4, -4});
        CHECK(config.party.healingAmount == doctest::Approx(30.0f));
        CHECK(config.party.cooperationRange == doctest::Approx(3.0f));
        CHECK(config.recovery.floorRecoveryRate == doctest::Approx(1.0f));
    }

    TEST_CASE("renovation bounds and budget") {
        auto config = DungeonConfig::loadFromJsonString(R"({
            "renovation": {
                "bounds": { "minX": -5, "maxX": 5, "minY": -3, "maxY": 3 },
                "validatePathOnEdit": false,
                "maxNodeExpansions": 50
            }
        })");

        CHECK(config.renovation.bounds.cellCount() == 77);
        CHECK_FALSE(config.renovation.validatePathOnEdit);
        CHECK(config.renovation.nodeBudget() == 50);
    }

    TEST_CASE("unknown keys are ignored") {
        auto config = DungeonConfig::loadFromJsonString(R"({ "shop": { "gold": 5 }, "floors": { "maxFloors": 7 } })");
        CHECK(config.floors.maxFloors == 7);
    }

    TEST_CASE("initial floor count is clamped to the cap") {
        auto config = DungeonConfig::loadFromJsonString(R"({ "floors": { "initialFloorCount": 9, "maxFloors": 4 } })");
        CHECK(config.floors.initialFloorCount == 4);

        auto zero = DungeonConfig::loadFromJsonString(R"({ "floors": { "initialFloorCount": 0 } })");
        CHECK(zero.floors.initialFloorCount == 1);
    }

    TEST_CASE("malformed JSON falls back to defaults") {
        auto config = DungeonConfig::loadFromJsonString("{ not json");
        CHECK(config.floors.maxFloors == 100);
        CHECK(config.party.maxPartiesPerFloor == 5);
    }

    TEST_CASE("wrong value types fall back to defaults") {
        auto config = DungeonConfig::loadFromJsonString(R"({ "floors": { "maxFloors": "lots" } })");
        CHECK(config.floors.maxFloors == 100);
    }

    TEST_CASE("missing file falls back to defaults") {
        auto config = DungeonConfig::loadFromJson("/nonexistent/dungeon_config.json");
        CHECK(config.floors.initialFloorCount == 3);
    }

    TEST_CASE("serialized config loads back to the same values") {
        DungeonConfig original;
        original.floors.maxFloors = 12;
        original.floors.defaultDownStair = {3, -7};
        original.party.engagementInterval = 0.5f;
        original.recovery.shelterRecoveryRate = 8.0f;

        auto restored = DungeonConfig::loadFromJsonString(original.toJsonString());
        CHECK(restored.floors.maxFloors == 12);
        CHECK(restored.floors.defaultDownStair == FloorGrid::GridCell{3, -7});
        CHECK(restored.party.engagementInterval == doctest::Approx(0.5f));
        CHECK(restored.recovery.shelterRecoveryRate == doctest::Approx(8.0f));
    }

    TEST_CASE("config file on disk") {
        const std::string path = "test_dungeon_config_tmp.json";
        {
            std::ofstream out(path);
            out << R"({ "floors": { "initialFloorCount": 5 }, "recovery": { "floorRecoveryRate": 2.5 } })";
        }

        auto config = DungeonConfig::loadFromJson(path);
        CHECK(config.floors.initialFloorCount == 5);
        CHECK(config.recovery.floorRecoveryRate == doctest::Approx(2.5f));

        std::remove(path.c_str());
    }
}
