#pragma once

#include <fruit/fruit.h>

struct DungeonConfig;
class DungeonEventDispatcher;
class FloorRegistry;
class RenovationSystem;
class PartyRegistry;
class PartyCombatSystem;
class RecoverySystem;
class Simulation;

namespace ecs {
class World;
}

namespace di {

/**
 * DungeonComponent - wires the dungeon simulation core
 *
 * Bindings provided (all singletons owned by the injector):
 * - DungeonConfig (bound from the caller's instance, read-only)
 * - DungeonEventDispatcher, ecs::World
 * - FloorRegistry, RenovationSystem
 * - PartyRegistry, PartyCombatSystem, RecoverySystem
 * - Simulation
 *
 * Usage:
 *   DungeonConfig config = DungeonConfig::loadFromJson(path);
 *   di::DungeonInjector injector(di::getDungeonComponent, &config);
 *   Simulation& sim = injector.get<Simulation&>();
 *
 * The config must outlive the injector.
 */
using DungeonComponent = fruit::Component<
    const DungeonConfig,
    DungeonEventDispatcher,
    ecs::World,
    FloorRegistry,
    RenovationSystem,
    PartyRegistry,
    PartyCombatSystem,
    RecoverySystem,
    Simulation
>;

using DungeonInjector = fruit::Injector<
    const DungeonConfig,
    DungeonEventDispatcher,
    ecs::World,
    FloorRegistry,
    RenovationSystem,
    PartyRegistry,
    PartyCombatSystem,
    RecoverySystem,
    Simulation
>;

DungeonComponent getDungeonComponent(const DungeonConfig* config);

/**
 * Binds only the configuration
 */
fruit::Component<const DungeonConfig> getDungeonConfigComponent(const DungeonConfig* config);

} // namespace di
