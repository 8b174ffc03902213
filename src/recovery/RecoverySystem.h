#pragma once

#include "config/DungeonConfig.h"
#include "ecs/World.h"

// Passive HP/MP regeneration for every living character.
// Characters tagged InShelter recover at the shelter rate.
class RecoverySystem {
public:
    explicit RecoverySystem(const RecoveryConfig& config);

    void update(float deltaTime, ecs::World& world);

    float healthRate(bool inShelter) const {
        return inShelter ? config_.shelterRecoveryRate : config_.floorRecoveryRate;
    }

    float manaRate(bool inShelter) const {
        return healthRate(inShelter) * config_.manaRecoveryMultiplier;
    }

private:
    RecoveryConfig config_;
};
