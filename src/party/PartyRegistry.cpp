#include "PartyRegistry.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

PartyRegistry::PartyRegistry(const PartyConfig& config, DungeonEventDispatcher& events)
    : config_(config), events_(events) {
    SDL_Log("PartyRegistry: Initialized (max %d parties per floor)", config_.maxPartiesPerFloor);
}

PartyResult PartyRegistry::createParty(const std::vector<ecs::Entity>& members, int32_t floorIndex,
                                       ecs::World& world) {
    if (members.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PartyRegistry: Cannot create a party without members");
        return PartyResult::failure(DungeonError::EmptyParty);
    }

    if (activePartyCount(floorIndex) >= static_cast<size_t>(config_.maxPartiesPerFloor)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PartyRegistry: Floor %d already has %d parties",
                    floorIndex, config_.maxPartiesPerFloor);
        return PartyResult::failure(DungeonError::FloorPartyLimit);
    }

    // Validate everything up front so a rejected party leaves no PartyMember behind
    const Affiliation side = world.isCombatant(members.front())
        ? world.get<Allegiance>(members.front()).side
        : Affiliation::Defender;
    for (size_t i = 0; i < members.size(); ++i) {
        ecs::Entity member = members[i];
        if (!world.isCombatant(member)) {
            return PartyResult::failure(DungeonError::InvalidEntity);
        }
        if (world.has<PartyMember>(member) ||
            std::find(members.begin(), members.begin() + static_cast<std::ptrdiff_t>(i), member) !=
                members.begin() + static_cast<std::ptrdiff_t>(i)) {
            return PartyResult::failure(DungeonError::AlreadyInParty);
        }
        if (world.get<Allegiance>(member).side != side) {
            return PartyResult::failure(DungeonError::AffiliationMismatch);
        }
    }

    auto party = std::make_unique<Party>(nextPartyId_++, floorIndex, world.getPosition(members.front()), config_);
    for (auto member : members) {
        DungeonError error = party->join(member, world);
        if (error != DungeonError::None) {
            // Validation above makes this unreachable
            party->disband(world);
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PartyRegistry: Join failed: %s", toString(error));
            return PartyResult::failure(error);
        }
    }

    const uint32_t createdId = party->id();
    SDL_Log("PartyRegistry: Created party %u with %zu members on floor %d",
            createdId, party->memberCount(), floorIndex);
    parties_.push_back(std::move(party));

    emit(DungeonEvents::PARTY_CREATED, *parties_.back());

    // A listener may have disbanded the party already
    if (Party* created = findParty(createdId)) {
        return PartyResult::success(created);
    }
    return PartyResult::failure(DungeonError::UnknownParty);
}

DungeonError PartyRegistry::disbandParty(uint32_t partyId, ecs::World& world) {
    auto it = std::find_if(parties_.begin(), parties_.end(),
        [partyId](const std::unique_ptr<Party>& p) { return p->id() == partyId; });
    if (it == parties_.end()) {
        return DungeonError::UnknownParty;
    }

    // Out of the store before listeners run
    std::unique_ptr<Party> party = std::move(*it);
    parties_.erase(it);

    party->disband(world);
    SDL_Log("PartyRegistry: Disbanded party %u", partyId);
    emit(DungeonEvents::PARTY_DISBANDED, *party);
    return DungeonError::None;
}

DungeonError PartyRegistry::moveParty(uint32_t partyId, const glm::vec2& target, ecs::World& world) {
    Party* party = findParty(partyId);
    if (!party) {
        return DungeonError::UnknownParty;
    }

    party->move(target, world);
    return DungeonError::None;
}

Party* PartyRegistry::findParty(uint32_t partyId) {
    for (auto& party : parties_) {
        if (party->id() == partyId) return party.get();
    }
    return nullptr;
}

const Party* PartyRegistry::findParty(uint32_t partyId) const {
    for (const auto& party : parties_) {
        if (party->id() == partyId) return party.get();
    }
    return nullptr;
}

std::vector<Party*> PartyRegistry::partiesOnFloor(int32_t floorIndex) {
    std::vector<Party*> result;
    for (auto& party : parties_) {
        if (party->isActive() && party->floorIndex() == floorIndex) {
            result.push_back(party.get());
        }
    }
    return result;
}

std::vector<Party*> PartyRegistry::activeParties() {
    std::vector<Party*> result;
    for (auto& party : parties_) {
        if (party->isActive()) result.push_back(party.get());
    }
    return result;
}

size_t PartyRegistry::activePartyCount(int32_t floorIndex) const {
    return static_cast<size_t>(std::count_if(parties_.begin(), parties_.end(),
        [floorIndex](const std::unique_ptr<Party>& p) {
            return p->isActive() && p->floorIndex() == floorIndex;
        }));
}

size_t PartyRegistry::cleanup(ecs::World& world) {
    for (auto& party : parties_) {
        size_t removed = party->removeDeadMembers(world);
        if (removed > 0) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "PartyRegistry: Party %u lost %zu members",
                         party->id(), removed);
        }
    }

    std::vector<std::unique_ptr<Party>> retired;
    for (auto it = parties_.begin(); it != parties_.end();) {
        if (!(*it)->isActive()) {
            SDL_Log("PartyRegistry: Party %u wiped out", (*it)->id());
            retired.push_back(std::move(*it));
            it = parties_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& party : retired) {
        emit(DungeonEvents::PARTY_DISBANDED, *party);
    }
    return retired.size();
}

void PartyRegistry::emit(const char* name, const Party& party) {
    DungeonEvent event;
    event.name = name;
    event.floorIndex = party.floorIndex();
    event.partyId = party.id();
    events_.dispatch(event);
}
