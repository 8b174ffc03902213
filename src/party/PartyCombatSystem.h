#pragma once

#include "config/DungeonConfig.h"
#include "core/DungeonEvent.h"
#include "ecs/World.h"

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

class Party;
class PartyRegistry;

// Outcome of one party striking another
struct PartyStrikeResult {
    float damageDealt = 0.0f;       // attackPower * partyAttackBonus
    float damageAbsorbed = 0.0f;    // What the defenders actually lost
    size_t casualties = 0;          // Defenders killed by this strike
};

// PartyCombatSystem resolves party-vs-party fights and party healing.
//
// Key concepts:
// - Healers pulse every healingInterval seconds, splitting the heal over the injured
// - Opposing parties on the same floor within cooperationRange engage
// - An engagement is a simultaneous exchange: both sides strike using their
//   attack power from before the exchange
// - Each pair exchanges at most once per engagementInterval
// - Events raised by update() are dispatched after both passes, so listeners
//   may create or disband parties
class PartyCombatSystem {
public:
    PartyCombatSystem(const PartyConfig& config, DungeonEventDispatcher& events);

    // Healing pass followed by the engagement pass
    void update(float deltaTime, PartyRegistry& parties, ecs::World& world);

    // One-sided strike from `attacker` on `defender`
    PartyStrikeResult engage(Party& attacker, Party& defender, ecs::World& world);

    // Heal `party` now if it has a living healer and injured members.
    // Returns the total health restored.
    float healParty(Party& party, ecs::World& world);

    bool inRange(const Party& a, const Party& b) const;

    uint32_t exchangeCount() const { return exchangeCount_; }

private:
    void updateHealing(float deltaTime, PartyRegistry& parties, ecs::World& world);
    void updateEngagements(float deltaTime, PartyRegistry& parties, ecs::World& world);
    float applyHealPulse(Party& party, ecs::World& world);
    void queue(const char* name, const Party& party, float amount);
    void flushEvents();

    static DungeonEvent makeEvent(const char* name, const Party& party, float amount);

    PartyConfig config_;
    DungeonEventDispatcher& events_;

    // Time since the last exchange, keyed by (invader party id, defender party id)
    std::map<std::pair<uint32_t, uint32_t>, float> engagementTimers_;
    uint32_t exchangeCount_ = 0;

    std::vector<DungeonEvent> pendingEvents_;
};
