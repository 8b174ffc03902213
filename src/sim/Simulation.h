#pragma once

#include "ecs/World.h"

#include <cstdint>

class FloorRegistry;
class RenovationSystem;
class PartyRegistry;
class PartyCombatSystem;
class RecoverySystem;

// Simulation advances the dungeon by fixed or variable time steps.
// It borrows every system; the injector owns them.
//
// Tick order:
//   1. party cleanup (members killed outside combat)
//   2. party combat (healing, then engagements)
//   3. recovery
//   4. party cleanup (casualties of this tick)
//   5. dead occupants leave their floors
class Simulation {
public:
    Simulation(ecs::World& world, FloorRegistry& floors, RenovationSystem& renovation,
               PartyRegistry& parties, PartyCombatSystem& combat, RecoverySystem& recovery);

    void tick(float deltaTime);

    // Run `steps` ticks of `deltaTime`
    void run(uint32_t steps, float deltaTime);

    float elapsedTime() const { return elapsed_; }
    uint64_t tickCount() const { return ticks_; }

    ecs::World& world() { return world_; }
    FloorRegistry& floors() { return floors_; }
    RenovationSystem& renovation() { return renovation_; }
    PartyRegistry& parties() { return parties_; }
    PartyCombatSystem& combat() { return combat_; }
    RecoverySystem& recovery() { return recovery_; }

private:
    // Returns the number of occupants removed
    size_t removeDeadOccupants();

    ecs::World& world_;
    FloorRegistry& floors_;
    RenovationSystem& renovation_;
    PartyRegistry& parties_;
    PartyCombatSystem& combat_;
    RecoverySystem& recovery_;

    float elapsed_ = 0.0f;
    uint64_t ticks_ = 0;
};
