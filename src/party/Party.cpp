#include "Party.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

Party::Party(uint32_t id, int32_t floorIndex, const glm::vec2& position, const PartyConfig& config)
    : id_(id), floorIndex_(floorIndex), position_(position), formationSpacing_(config.formationSpacing) {}

bool Party::hasMember(ecs::Entity entity) const {
    return std::find(members_.begin(), members_.end(), entity) != members_.end();
}

DungeonError Party::join(ecs::Entity entity, ecs::World& world) {
    // A party emptied by leave, cleanup or disband stays retired
    if (!active_) {
        return DungeonError::UnknownParty;
    }
    if (!world.isCombatant(entity)) {
        return DungeonError::InvalidEntity;
    }
    if (world.has<PartyMember>(entity)) {
        return DungeonError::AlreadyInParty;
    }

    Affiliation side = world.get<Allegiance>(entity).side;
    if (affiliation_ && *affiliation_ != side) {
        return DungeonError::AffiliationMismatch;
    }

    affiliation_ = side;
    members_.push_back(entity);
    world.add<PartyMember>(entity, PartyMember{id_});
    return DungeonError::None;
}

DungeonError Party::leave(ecs::Entity entity, ecs::World& world) {
    auto it = std::find(members_.begin(), members_.end(), entity);
    if (it == members_.end()) {
        return DungeonError::NotAMember;
    }

    members_.erase(it);
    release(entity, world);

    if (members_.empty()) {
        active_ = false;
    }
    return DungeonError::None;
}

size_t Party::livingMemberCount(const ecs::World& world) const {
    return static_cast<size_t>(std::count_if(members_.begin(), members_.end(),
        [&world](ecs::Entity e) { return world.isAlive(e); }));
}

size_t Party::healerCount(const ecs::World& world) const {
    return static_cast<size_t>(std::count_if(members_.begin(), members_.end(),
        [&world](ecs::Entity e) { return world.isAlive(e) && world.has<HealerTag>(e); }));
}

size_t Party::injuredCount(const ecs::World& world) const {
    return static_cast<size_t>(std::count_if(members_.begin(), members_.end(),
        [&world](ecs::Entity e) {
            const auto* health = world.tryGet<Health>(e);
            return health && health->isInjured();
        }));
}

float Party::distributeDamage(float totalDamage, ecs::World& world) {
    if (totalDamage <= 0.0f) return 0.0f;

    // Snapshot the living set first so members dying mid-pass don't change the share
    std::vector<ecs::Entity> living;
    for (auto member : members_) {
        if (world.isAlive(member)) living.push_back(member);
    }
    if (living.empty()) return 0.0f;

    float share = totalDamage / static_cast<float>(living.size());
    float absorbed = 0.0f;
    for (auto member : living) {
        auto& health = world.get<Health>(member);
        absorbed += health.takeDamage(share);
        if (health.isDead) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Party %u: member %u died",
                         id_, static_cast<uint32_t>(member));
        }
    }
    return absorbed;
}

float Party::attackPower(const ecs::World& world) const {
    float total = 0.0f;
    for (auto member : members_) {
        if (!world.isAlive(member)) continue;
        if (const auto* attack = world.tryGet<AttackPower>(member)) {
            total += attack->value;
        }
    }
    return total;
}

float Party::applyHealing(float amount, ecs::World& world) {
    float restored = 0.0f;
    for (auto member : members_) {
        if (auto* health = world.tryGet<Health>(member)) {
            restored += health->heal(amount);
        }
    }
    return restored;
}

void Party::move(const glm::vec2& target, ecs::World& world) {
    position_ = target;

    // Centered line along x: offsets -(n-1)/2 .. (n-1)/2 times spacing
    float center = (static_cast<float>(members_.size()) - 1.0f) * 0.5f;
    for (size_t i = 0; i < members_.size(); ++i) {
        float offset = (static_cast<float>(i) - center) * formationSpacing_;
        world.setPosition(members_[i], target + glm::vec2(offset, 0.0f));
    }
}

size_t Party::removeDeadMembers(ecs::World& world) {
    size_t before = members_.size();

    auto it = std::stable_partition(members_.begin(), members_.end(),
        [&world](ecs::Entity e) { return world.isAlive(e); });
    for (auto dead = it; dead != members_.end(); ++dead) {
        release(*dead, world);
    }
    members_.erase(it, members_.end());

    if (members_.empty()) {
        active_ = false;
    }
    return before - members_.size();
}

void Party::disband(ecs::World& world) {
    for (auto member : members_) {
        release(member, world);
    }
    members_.clear();
    active_ = false;
}

void Party::release(ecs::Entity entity, ecs::World& world) {
    const auto* membership = world.tryGet<PartyMember>(entity);
    if (membership && membership->partyId == id_) {
        world.remove<PartyMember>(entity);
    }
}
