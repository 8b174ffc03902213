// Tests for the dungeon DI component - singleton wiring through Fruit

#include <doctest/doctest.h>
#include "di/DungeonComponent.h"
#include "config/DungeonConfig.h"
#include "core/DungeonEvent.h"
#include "ecs/World.h"
#include "floor/FloorRegistry.h"
#include "party/PartyCombatSystem.h"
#include "party/PartyRegistry.h"
#include "recovery/RecoverySystem.h"
#include "renovation/RenovationSystem.h"
#include "sim/Simulation.h"

TEST_SUITE("DungeonComponent") {
    TEST_CASE("injector builds the floors from the config") {
        DungeonConfig config;
        config.floors.initialFloorCount = 4;
        di::DungeonInjector injector(di::getDungeonComponent, &config);

        FloorRegistry& floors = injector.get<FloorRegistry&>();
        CHECK(floors.floorCount() == 4);
        CHECK(floors.coreFloor() == floors.getFloor(4));

        const DungeonConfig& bound = injector.get<const DungeonConfig&>();
        CHECK(&bound == &config);
    }

    TEST_CASE("systems share singleton instances") {
        DungeonConfig config;
        di::DungeonInjector injector(di::getDungeonComponent, &config);

        Simulation& sim = injector.get<Simulation&>();
        CHECK(&sim.world() == &injector.get<ecs::World&>());
        CHECK(&sim.floors() == &injector.get<FloorRegistry&>());
        CHECK(&sim.renovation() == &injector.get<RenovationSystem&>());
        CHECK(&sim.parties() == &injector.get<PartyRegistry&>());
        CHECK(&sim.combat() == &injector.get<PartyCombatSystem&>());
        CHECK(&sim.recovery() == &injector.get<RecoverySystem&>());
        CHECK(&injector.get<Simulation&>() == &sim);
    }

    TEST_CASE("systems report through the shared dispatcher") {
        DungeonConfig config;
        di::DungeonInjector injector(di::getDungeonComponent, &config);

        DungeonEventDispatcher& events = injector.get<DungeonEventDispatcher&>();
        int started = 0;
        uint32_t id = events.addListener([&started](const DungeonEvent& e) {
            if (e.name == DungeonEvents::RENOVATION_STARTED) started++;
        });

        RenovationSystem& renovation = injector.get<RenovationSystem&>();
        CHECK(renovation.startRenovation(1) == DungeonError::None);
        CHECK(started == 1);

        events.removeListener(id);
    }

    TEST_CASE("wired simulation runs a fight") {
        DungeonConfig config;
        di::DungeonInjector injector(di::getDungeonComponent, &config);

        ecs::World& world = injector.get<ecs::World&>();
        FloorRegistry& floors = injector.get<FloorRegistry&>();
        PartyRegistry& parties = injector.get<PartyRegistry&>();
        Simulation& sim = injector.get<Simulation&>();

        auto golem = world.createMonster(MonsterKind::LesserGolem, 1, {0.0f, 0.0f});
        auto rogue = world.createInvader(InvaderKind::Rogue, 1, {1.0f, 0.0f});
        REQUIRE(floors.placeMonster(2, golem, {0.0f, 0.0f}) == DungeonError::None);
        REQUIRE(floors.addInvader(2, rogue, {1.0f, 0.0f}) == DungeonError::None);
        REQUIRE(parties.createParty({golem}, 2, world));
        REQUIRE(parties.createParty({rogue}, 2, world));

        sim.tick(0.5f);

        CHECK(injector.get<PartyCombatSystem&>().exchangeCount() == 1);
        CHECK(world.get<Health>(golem).current < world.get<Health>(golem).maximum);
        CHECK(world.get<Health>(rogue).current == doctest::Approx(56.5f));
    }
}
