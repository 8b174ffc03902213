#include "config/DungeonConfig.h"
#include "core/DungeonEvent.h"
#include "di/DungeonComponent.h"
#include "ecs/World.h"
#include "floor/FloorRegistry.h"
#include "party/PartyRegistry.h"
#include "renovation/RenovationSystem.h"
#include "sim/Simulation.h"

#include <SDL3/SDL.h>
#include <fruit/fruit.h>
#include <cstdlib>
#include <string>
#include <vector>

static void printUsage(const char* progName) {
    SDL_Log("Usage: %s [options]", progName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <path>     Load dungeon settings from a JSON file");
    SDL_Log("  --ticks <n>         Number of simulation ticks to run (default 30)");
    SDL_Log("  --dt <seconds>      Time step per tick (default 0.5)");
    SDL_Log("  --dump-config       Print the effective configuration and exit");
    SDL_Log("  --verbose           Enable debug logging");
    SDL_Log("");
    SDL_Log("Examples:");
    SDL_Log("  %s --config dungeon.json --ticks 120", progName);
    SDL_Log("  %s --dump-config", progName);
}

// Walls forming a short corridor on the given floor. Rejected walls are logged
// by the renovation system and skipped.
static void renovateFloor(RenovationSystem& renovation, int32_t floorIndex) {
    if (renovation.startRenovation(floorIndex) != DungeonError::None) {
        return;
    }

    const std::vector<FloorGrid::GridCell> layout = {
        {0, -2}, {0, -1}, {0, 0}, {0, 1}, {0, 2},
        {2, 3}, {2, 2}, {2, 1},
    };
    size_t placed = 0;
    for (const auto& cell : layout) {
        if (renovation.placeWall(cell) == DungeonError::None) {
            placed++;
        }
    }
    SDL_Log("Renovation: Placed %zu of %zu walls on floor %d", placed, layout.size(), floorIndex);

    DungeonError saved = renovation.endRenovation(true);
    if (saved != DungeonError::None) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Renovation: Layout for floor %d not saved: %s",
                    floorIndex, describe(saved));
    }
}

static std::vector<ecs::Entity> spawnDefenders(ecs::World& world, FloorRegistry& floors, int32_t floorIndex) {
    std::vector<ecs::Entity> placed;
    const std::vector<std::pair<MonsterKind, glm::vec2>> roster = {
        {MonsterKind::LesserGolem, {-2.0f, -4.0f}},
        {MonsterKind::Goblin, {0.0f, -5.0f}},
        {MonsterKind::Slime, {2.0f, -4.0f}},
    };

    for (const auto& [kind, position] : roster) {
        ecs::Entity monster = world.createMonster(kind, 2, position);
        if (floors.placeMonster(floorIndex, monster, position) == DungeonError::None) {
            placed.push_back(monster);
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Placement: %s rejected at (%.1f, %.1f)",
                        Archetypes::toString(kind), position.x, position.y);
            world.destroy(monster);
        }
    }
    return placed;
}

static std::vector<ecs::Entity> spawnInvaders(ecs::World& world, FloorRegistry& floors, int32_t floorIndex) {
    std::vector<ecs::Entity> arrived;
    const std::vector<InvaderKind> roster = {InvaderKind::Warrior, InvaderKind::Mage, InvaderKind::Cleric};

    glm::vec2 entry(-4.0f, 4.0f);
    for (auto kind : roster) {
        ecs::Entity invader = world.createInvader(kind, 1, entry);
        if (floors.addInvader(floorIndex, invader, entry) == DungeonError::None) {
            arrived.push_back(invader);
        }
    }
    return arrived;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    uint32_t ticks = 30;
    float deltaTime = 0.5f;
    bool dumpConfig = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--ticks" && i + 1 < argc) {
            ticks = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--dt" && i + 1 < argc) {
            deltaTime = std::strtof(argv[++i], nullptr);
        } else if (arg == "--dump-config") {
            dumpConfig = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument: %s", arg.c_str());
        }
    }

    if (verbose) {
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
    }

    DungeonConfig config = configPath.empty() ? DungeonConfig{} : DungeonConfig::loadFromJson(configPath);

    if (dumpConfig) {
        SDL_Log("%s", config.toJsonString().c_str());
        return 0;
    }

    if (deltaTime <= 0.0f) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Time step must be positive (got %.3f)", deltaTime);
        return 1;
    }

    di::DungeonInjector injector(di::getDungeonComponent, &config);
    Simulation& sim = injector.get<Simulation&>();
    FloorRegistry& floors = sim.floors();
    ecs::World& world = sim.world();

    uint32_t listenerId = injector.get<DungeonEventDispatcher&>().addListener([](const DungeonEvent& event) {
        if (event.name == DungeonEvents::RENOVATION_ERROR) {
            SDL_Log("Event: %s (floor %d): %s", event.name.c_str(), event.floorIndex, event.message.c_str());
        } else if (event.name == DungeonEvents::PARTY_DISBANDED || event.name == DungeonEvents::FLOOR_EXPANDED) {
            SDL_Log("Event: %s (floor %d, party %u)", event.name.c_str(), event.floorIndex, event.partyId);
        }
    });

    // Dig one floor deeper so the battle floor is a middle floor with both stairs
    int32_t cost = floors.expansionCost(floors.floorCount() + 1);
    if (FloorResult expanded = floors.expand()) {
        SDL_Log("Dungeon: Dug floor %d for %d gold", expanded->index(), cost);
    }

    const int32_t battleFloor = 2;
    renovateFloor(sim.renovation(), battleFloor);

    std::vector<ecs::Entity> defenders = spawnDefenders(world, floors, battleFloor);
    std::vector<ecs::Entity> invaders = spawnInvaders(world, floors, battleFloor);

    PartyRegistry& parties = sim.parties();
    PartyResult defenderParty = parties.createParty(defenders, battleFloor, world);
    PartyResult invaderParty = parties.createParty(invaders, battleFloor, world);
    if (!defenderParty || !invaderParty) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Dungeon: Failed to form parties (%s / %s)",
                     toString(defenderParty.error), toString(invaderParty.error));
        return 1;
    }

    uint32_t invaderId = invaderParty->id();
    if (parties.moveParty(invaderId, glm::vec2(0.0f, -3.0f), world) != DungeonError::None) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Dungeon: Invader party %u could not advance", invaderId);
        return 1;
    }
    for (auto member : invaderParty->members()) {
        floors.updateOccupantPosition(member, world.getPosition(member));
    }

    SDL_Log("Dungeon: %d floors, core on floor %d, running %u ticks of %.2fs",
            floors.floorCount(), floors.coreFloor()->index(), ticks, deltaTime);

    sim.run(ticks, deltaTime);

    const Floor* floor = floors.getFloor(battleFloor);
    SDL_Log("Dungeon: After %.1fs floor %d holds %zu monsters and %zu invaders (%zu parties left)",
            sim.elapsedTime(), battleFloor, floor->monsterCount(), floor->invaderCount(), parties.partyCount());

    injector.get<DungeonEventDispatcher&>().removeListener(listenerId);
    return 0;
}
