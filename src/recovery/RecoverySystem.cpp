#include "RecoverySystem.h"

#include <SDL3/SDL_log.h>

RecoverySystem::RecoverySystem(const RecoveryConfig& config)
    : config_(config) {
    SDL_Log("RecoverySystem: Initialized (floor %.1f/s, shelter %.1f/s, mana x%.2f)",
            config_.floorRecoveryRate, config_.shelterRecoveryRate, config_.manaRecoveryMultiplier);
}

void RecoverySystem::update(float deltaTime, ecs::World& world) {
    if (deltaTime <= 0.0f) return;

    auto& registry = world.registry();
    auto view = registry.view<Health>();
    for (auto entity : view) {
        auto& health = view.get<Health>(entity);
        if (!health.isAlive()) continue;

        bool sheltered = registry.all_of<InShelter>(entity);
        health.heal(healthRate(sheltered) * deltaTime);

        if (auto* mana = registry.try_get<Mana>(entity)) {
            mana->restore(manaRate(sheltered) * deltaTime);
        }
    }
}
