#include "PartyCombatSystem.h"
#include "Party.h"
#include "PartyRegistry.h"

#include <SDL3/SDL_log.h>
#include <glm/glm.hpp>
#include <vector>

PartyCombatSystem::PartyCombatSystem(const PartyConfig& config, DungeonEventDispatcher& events)
    : config_(config), events_(events) {}

void PartyCombatSystem::update(float deltaTime, PartyRegistry& parties, ecs::World& world) {
    updateHealing(deltaTime, parties, world);
    updateEngagements(deltaTime, parties, world);
    flushEvents();
}

PartyStrikeResult PartyCombatSystem::engage(Party& attacker, Party& defender, ecs::World& world) {
    PartyStrikeResult result;
    if (!attacker.isActive() || !defender.isActive()) {
        return result;
    }

    size_t livingBefore = defender.livingMemberCount(world);
    result.damageDealt = attacker.attackPower(world) * config_.partyAttackBonus;
    result.damageAbsorbed = defender.distributeDamage(result.damageDealt, world);
    result.casualties = livingBefore - defender.livingMemberCount(world);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                 "PartyCombatSystem: Party %u hit party %u for %.1f (%zu casualties)",
                 attacker.id(), defender.id(), result.damageAbsorbed, result.casualties);

    // Last use of the parties: a listener may disband them
    if (result.damageAbsorbed > 0.0f) {
        events_.dispatch(makeEvent(DungeonEvents::PARTY_DAMAGED, defender, result.damageAbsorbed));
    }
    return result;
}

float PartyCombatSystem::healParty(Party& party, ecs::World& world) {
    float restored = applyHealPulse(party, world);
    if (restored > 0.0f) {
        events_.dispatch(makeEvent(DungeonEvents::PARTY_HEALED, party, restored));
    }
    return restored;
}

float PartyCombatSystem::applyHealPulse(Party& party, ecs::World& world) {
    size_t healers = party.healerCount(world);
    size_t injured = party.injuredCount(world);
    if (healers == 0 || injured == 0) {
        return 0.0f;
    }

    float perMember = config_.healingAmount * static_cast<float>(healers) / static_cast<float>(injured);

    float restored = 0.0f;
    for (auto member : party.members()) {
        auto* health = world.tryGet<Health>(member);
        if (health && health->isInjured()) {
            restored += health->heal(perMember);
        }
    }

    if (restored > 0.0f) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "PartyCombatSystem: Party %u healed %.1f (%zu healers)",
                     party.id(), restored, healers);
    }
    return restored;
}

bool PartyCombatSystem::inRange(const Party& a, const Party& b) const {
    return a.floorIndex() == b.floorIndex() &&
           glm::distance(a.position(), b.position()) <= config_.cooperationRange;
}

void PartyCombatSystem::updateHealing(float deltaTime, PartyRegistry& parties, ecs::World& world) {
    for (Party* party : parties.activeParties()) {
        party->healCooldown -= deltaTime;
        if (party->healCooldown > 0.0f) continue;

        float restored = applyHealPulse(*party, world);
        if (restored > 0.0f) {
            queue(DungeonEvents::PARTY_HEALED, *party, restored);
            party->healCooldown = config_.healingInterval;
        } else {
            // Nothing to heal: stay ready for the next tick
            party->healCooldown = 0.0f;
        }
    }
}

void PartyCombatSystem::updateEngagements(float deltaTime, PartyRegistry& parties, ecs::World& world) {
    for (auto& entry : engagementTimers_) {
        entry.second += deltaTime;
    }

    std::vector<Party*> invaders;
    std::vector<Party*> defenders;
    for (Party* party : parties.activeParties()) {
        auto side = party->affiliation();
        if (!side) continue;
        (*side == Affiliation::Invader ? invaders : defenders).push_back(party);
    }

    for (Party* invader : invaders) {
        for (Party* defender : defenders) {
            if (!inRange(*invader, *defender)) continue;
            if (invader->livingMemberCount(world) == 0 || defender->livingMemberCount(world) == 0) continue;

            auto key = std::make_pair(invader->id(), defender->id());
            auto timer = engagementTimers_.find(key);
            if (timer != engagementTimers_.end() && timer->second < config_.engagementInterval) {
                continue;
            }

            // Both strikes use attack power from before the exchange
            float invaderDamage = invader->attackPower(world) * config_.partyAttackBonus;
            float defenderDamage = defender->attackPower(world) * config_.partyAttackBonus;

            float absorbedByDefender = defender->distributeDamage(invaderDamage, world);
            float absorbedByInvader = invader->distributeDamage(defenderDamage, world);

            if (absorbedByDefender > 0.0f) queue(DungeonEvents::PARTY_DAMAGED, *defender, absorbedByDefender);
            if (absorbedByInvader > 0.0f) queue(DungeonEvents::PARTY_DAMAGED, *invader, absorbedByInvader);

            engagementTimers_[key] = 0.0f;
            exchangeCount_++;

            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                         "PartyCombatSystem: Party %u and party %u exchanged %.1f / %.1f",
                         invader->id(), defender->id(), absorbedByDefender, absorbedByInvader);
        }
    }

    // Forget pairs whose parties are gone
    for (auto it = engagementTimers_.begin(); it != engagementTimers_.end();) {
        if (!parties.findParty(it->first.first) || !parties.findParty(it->first.second)) {
            it = engagementTimers_.erase(it);
        } else {
            ++it;
        }
    }
}

void PartyCombatSystem::queue(const char* name, const Party& party, float amount) {
    pendingEvents_.push_back(makeEvent(name, party, amount));
}

void PartyCombatSystem::flushEvents() {
    // Swap out first: listeners may trigger another update
    std::vector<DungeonEvent> events;
    events.swap(pendingEvents_);
    for (const auto& event : events) {
        events_.dispatch(event);
    }
}

DungeonEvent PartyCombatSystem::makeEvent(const char* name, const Party& party, float amount) {
    DungeonEvent event;
    event.name = name;
    event.floorIndex = party.floorIndex();
    event.partyId = party.id();
    event.amount = amount;
    return event;
}
