#pragma once

#include "floor/FloorGridLogic.h"

#include <cstdint>
#include <string>

// Floor layout and growth settings
struct FloorConfig {
    int32_t initialFloorCount = 3;
    int32_t maxFloors = 100;
    int32_t maxMonstersPerFloor = 15;

    // Default stair positions for newly created floors
    FloorGrid::GridCell defaultUpStair{-4, 4};
    FloorGrid::GridCell defaultDownStair{4, -4};

    // Expansion pricing: the first `freeFloors` floors cost nothing, after
    // that baseCost * costMultiplier^(target - freeFloors)
    int32_t freeFloors = 3;
    int32_t expansionBaseCost = 200;
    float expansionCostMultiplier = 1.5f;
};

// Wall editing and stair path validation
struct RenovationConfig {
    FloorGrid::GridBounds bounds;
    bool validatePathOnEdit = true;

    // 0 = derive from the bounds (provable upper bound on dequeued cells)
    uint32_t maxNodeExpansions = 0;

    uint32_t nodeBudget() const {
        return maxNodeExpansions > 0 ? maxNodeExpansions : FloorGrid::defaultNodeBudget(bounds);
    }
};

// Party management and party-vs-party combat
struct PartyConfig {
    int32_t maxPartiesPerFloor = 5;
    float formationSpacing = 1.0f;

    float cooperationRange = 3.0f;      // Engagement radius between parties
    float healingInterval = 2.0f;       // Seconds between healer pulses
    float healingAmount = 15.0f;        // Heal per living healer per pulse
    float partyAttackBonus = 1.2f;      // Multiplier on aggregate attack
    float engagementInterval = 1.0f;    // Seconds between exchanges per pair
};

// HP/MP regeneration
struct RecoveryConfig {
    float floorRecoveryRate = 1.0f;     // HP per second while on a floor
    float shelterRecoveryRate = 5.0f;   // HP per second while in the shelter
    float manaRecoveryMultiplier = 0.8f;
};

struct DungeonConfig {
    FloorConfig floors;
    RenovationConfig renovation;
    PartyConfig party;
    RecoveryConfig recovery;

    // Load configuration from a JSON file. Missing keys keep their defaults;
    // an unreadable or malformed file yields the default configuration.
    static DungeonConfig loadFromJson(const std::string& jsonPath);

    static DungeonConfig loadFromJsonString(const std::string& jsonString);

    // Serialize to a JSON string (all keys, pretty printed)
    std::string toJsonString() const;
};
