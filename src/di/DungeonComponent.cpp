#include "DungeonComponent.h"
#include "config/DungeonConfig.h"
#include "core/DungeonEvent.h"
#include "ecs/World.h"
#include "floor/FloorRegistry.h"
#include "party/PartyCombatSystem.h"
#include "party/PartyRegistry.h"
#include "recovery/RecoverySystem.h"
#include "renovation/RenovationSystem.h"
#include "sim/Simulation.h"

namespace di {

namespace {

fruit::Component<DungeonEventDispatcher, ecs::World> getSharedStateComponent() {
    return fruit::createComponent()
        .registerProvider([]() { return new DungeonEventDispatcher(); })
        .registerProvider([]() { return new ecs::World(); });
}

fruit::Component<
    fruit::Required<const DungeonConfig, DungeonEventDispatcher>,
    FloorRegistry,
    RenovationSystem
> getFloorSystemsComponent() {
    return fruit::createComponent()
        .registerProvider([](const DungeonConfig& config, DungeonEventDispatcher& events) {
            return new FloorRegistry(config.floors, events);
        })
        .registerProvider([](FloorRegistry& floors, const DungeonConfig& config,
                             DungeonEventDispatcher& events) {
            return new RenovationSystem(floors, config.renovation, events);
        });
}

fruit::Component<
    fruit::Required<const DungeonConfig, DungeonEventDispatcher>,
    PartyRegistry,
    PartyCombatSystem,
    RecoverySystem
> getCombatSystemsComponent() {
    return fruit::createComponent()
        .registerProvider([](const DungeonConfig& config, DungeonEventDispatcher& events) {
            return new PartyRegistry(config.party, events);
        })
        .registerProvider([](const DungeonConfig& config, DungeonEventDispatcher& events) {
            return new PartyCombatSystem(config.party, events);
        })
        .registerProvider([](const DungeonConfig& config) {
            return new RecoverySystem(config.recovery);
        });
}

} // anonymous namespace

fruit::Component<const DungeonConfig> getDungeonConfigComponent(const DungeonConfig* config) {
    return fruit::createComponent()
        .bindInstance(*config);
}

DungeonComponent getDungeonComponent(const DungeonConfig* config) {
    return fruit::createComponent()
        .install(getDungeonConfigComponent, config)
        .install(getSharedStateComponent)
        .install(getFloorSystemsComponent)
        .install(getCombatSystemsComponent)
        .registerProvider([](ecs::World& world, FloorRegistry& floors, RenovationSystem& renovation,
                             PartyRegistry& parties, PartyCombatSystem& combat, RecoverySystem& recovery) {
            return new Simulation(world, floors, renovation, parties, combat, recovery);
        });
}

} // namespace di
