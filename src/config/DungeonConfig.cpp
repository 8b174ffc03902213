#include "DungeonConfig.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace {

FloorGrid::GridCell readCell(const json& j, const FloorGrid::GridCell& fallback) {
    return FloorGrid::GridCell{j.value("x", fallback.x), j.value("y", fallback.y)};
}

json cellToJson(const FloorGrid::GridCell& cell) {
    return json{{"x", cell.x}, {"y", cell.y}};
}

} // anonymous namespace

DungeonConfig DungeonConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DungeonConfig: Failed to open config file: %s", jsonPath.c_str());
        return DungeonConfig{};
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

DungeonConfig DungeonConfig::loadFromJsonString(const std::string& jsonString) {
    DungeonConfig config;

    try {
        json j = json::parse(jsonString);

        if (j.contains("floors")) {
            const auto& floors = j["floors"];
            config.floors.initialFloorCount = floors.value("initialFloorCount", 3);
            config.floors.maxFloors = floors.value("maxFloors", 100);
            config.floors.maxMonstersPerFloor = floors.value("maxMonstersPerFloor", 15);
            if (floors.contains("upStair")) {
                config.floors.defaultUpStair = readCell(floors["upStair"], config.floors.defaultUpStair);
            }
            if (floors.contains("downStair")) {
                config.floors.defaultDownStair = readCell(floors["downStair"], config.floors.defaultDownStair);
            }
            config.floors.freeFloors = floors.value("freeFloors", 3);
            config.floors.expansionBaseCost = floors.value("expansionBaseCost", 200);
            config.floors.expansionCostMultiplier = floors.value("expansionCostMultiplier", 1.5f);
        }

        if (j.contains("renovation")) {
            const auto& renovation = j["renovation"];
            if (renovation.contains("bounds")) {
                const auto& b = renovation["bounds"];
                config.renovation.bounds.minX = b.value("minX", -10);
                config.renovation.bounds.maxX = b.value("maxX", 10);
                config.renovation.bounds.minY = b.value("minY", -10);
                config.renovation.bounds.maxY = b.value("maxY", 10);
            }
            config.renovation.validatePathOnEdit = renovation.value("validatePathOnEdit", true);
            config.renovation.maxNodeExpansions = renovation.value("maxNodeExpansions", 0u);
        }

        if (j.contains("party")) {
            const auto& party = j["party"];
            config.party.maxPartiesPerFloor = party.value("maxPartiesPerFloor", 5);
            config.party.formationSpacing = party.value("formationSpacing", 1.0f);
            config.party.cooperationRange = party.value("cooperationRange", 3.0f);
            config.party.healingInterval = party.value("healingInterval", 2.0f);
            config.party.healingAmount = party.value("healingAmount", 15.0f);
            config.party.partyAttackBonus = party.value("partyAttackBonus", 1.2f);
            config.party.engagementInterval = party.value("engagementInterval", 1.0f);
        }

        if (j.contains("recovery")) {
            const auto& recovery = j["recovery"];
            config.recovery.floorRecoveryRate = recovery.value("floorRecoveryRate", 1.0f);
            config.recovery.shelterRecoveryRate = recovery.value("shelterRecoveryRate", 5.0f);
            config.recovery.manaRecoveryMultiplier = recovery.value("manaRecoveryMultiplier", 0.8f);
        }

        if (config.floors.initialFloorCount < 1 || config.floors.initialFloorCount > config.floors.maxFloors) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "DungeonConfig: initialFloorCount %d outside [1, %d], clamping",
                config.floors.initialFloorCount, config.floors.maxFloors);
            config.floors.initialFloorCount = std::max(1, std::min(config.floors.initialFloorCount, config.floors.maxFloors));
        }

        SDL_Log("DungeonConfig: Loaded config with %d initial floors (max %d), node budget %u",
                config.floors.initialFloorCount, config.floors.maxFloors, config.renovation.nodeBudget());

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DungeonConfig: JSON parse error: %s", e.what());
        return DungeonConfig{};
    }

    return config;
}

std::string DungeonConfig::toJsonString() const {
    json j;

    j["floors"] = {
        {"initialFloorCount", floors.initialFloorCount},
        {"maxFloors", floors.maxFloors},
        {"maxMonstersPerFloor", floors.maxMonstersPerFloor},
        {"upStair", cellToJson(floors.defaultUpStair)},
        {"downStair", cellToJson(floors.defaultDownStair)},
        {"freeFloors", floors.freeFloors},
        {"expansionBaseCost", floors.expansionBaseCost},
        {"expansionCostMultiplier", floors.expansionCostMultiplier}
    };

    j["renovation"] = {
        {"bounds", {
            {"minX", renovation.bounds.minX},
            {"maxX", renovation.bounds.maxX},
            {"minY", renovation.bounds.minY},
            {"maxY", renovation.bounds.maxY}
        }},
        {"validatePathOnEdit", renovation.validatePathOnEdit},
        {"maxNodeExpansions", renovation.maxNodeExpansions}
    };

    j["party"] = {
        {"maxPartiesPerFloor", party.maxPartiesPerFloor},
        {"formationSpacing", party.formationSpacing},
        {"cooperationRange", party.cooperationRange},
        {"healingInterval", party.healingInterval},
        {"healingAmount", party.healingAmount},
        {"partyAttackBonus", party.partyAttackBonus},
        {"engagementInterval", party.engagementInterval}
    };

    j["recovery"] = {
        {"floorRecoveryRate", recovery.floorRecoveryRate},
        {"shelterRecoveryRate", recovery.shelterRecoveryRate},
        {"manaRecoveryMultiplier", recovery.manaRecoveryMultiplier}
    };

    return j.dump(2);
}
