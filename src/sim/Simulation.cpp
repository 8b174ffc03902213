#include "Simulation.h"
#include "floor/FloorRegistry.h"
#include "party/PartyCombatSystem.h"
#include "party/PartyRegistry.h"
#include "recovery/RecoverySystem.h"
#include "renovation/RenovationSystem.h"

#include <SDL3/SDL_log.h>
#include <vector>

Simulation::Simulation(ecs::World& world, FloorRegistry& floors, RenovationSystem& renovation,
                       PartyRegistry& parties, PartyCombatSystem& combat, RecoverySystem& recovery)
    : world_(world), floors_(floors), renovation_(renovation),
      parties_(parties), combat_(combat), recovery_(recovery) {}

void Simulation::tick(float deltaTime) {
    if (deltaTime < 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Simulation: Ignoring negative time step %.3f", deltaTime);
        return;
    }

    parties_.cleanup(world_);
    combat_.update(deltaTime, parties_, world_);
    recovery_.update(deltaTime, world_);
    parties_.cleanup(world_);

    size_t removed = removeDeadOccupants();
    if (removed > 0) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Simulation: %zu occupants fell at t=%.2f",
                     removed, elapsed_);
    }

    elapsed_ += deltaTime;
    ticks_++;
}

void Simulation::run(uint32_t steps, float deltaTime) {
    for (uint32_t i = 0; i < steps; ++i) {
        tick(deltaTime);
    }
}

size_t Simulation::removeDeadOccupants() {
    std::vector<entt::entity> dead;
    for (const auto& floor : floors_.floors()) {
        for (const auto& occupant : floor->occupants()) {
            if (!world_.isAlive(occupant.entity)) {
                dead.push_back(occupant.entity);
            }
        }
    }

    for (auto entity : dead) {
        floors_.removeOccupant(entity);
    }
    return dead.size();
}
