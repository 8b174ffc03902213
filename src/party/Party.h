#pragma once

#include "config/DungeonConfig.h"
#include "core/DungeonError.h"
#include "ecs/World.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Party groups same-side characters so they fight and heal as one unit.
//
// Key concepts:
// - Members are entity handles; their stats live in the ECS world
// - An entity belongs to at most one party (PartyMember component)
// - Incoming damage is split evenly over the living members
// - Dead members stay listed until removeDeadMembers() runs
// - A party with no members left is inactive and gets dropped by the registry
class Party {
public:
    Party(uint32_t id, int32_t floorIndex, const glm::vec2& position, const PartyConfig& config);

    uint32_t id() const { return id_; }
    int32_t floorIndex() const { return floorIndex_; }
    const glm::vec2& position() const { return position_; }
    bool isActive() const { return active_; }

    const std::vector<ecs::Entity>& members() const { return members_; }
    size_t memberCount() const { return members_.size(); }
    bool hasMember(ecs::Entity entity) const;

    // Membership. An inactive party rejects joins with UnknownParty.
    DungeonError join(ecs::Entity entity, ecs::World& world);
    DungeonError leave(ecs::Entity entity, ecs::World& world);

    // Side shared by all members, empty before the first join
    std::optional<Affiliation> affiliation() const { return affiliation_; }

    size_t livingMemberCount(const ecs::World& world) const;
    size_t healerCount(const ecs::World& world) const;
    size_t injuredCount(const ecs::World& world) const;

    // Split `totalDamage` evenly over living members. Returns the damage
    // actually absorbed.
    float distributeDamage(float totalDamage, ecs::World& world);

    // Sum of the living members' attack power
    float attackPower(const ecs::World& world) const;

    // Heal every living member by `amount`. Returns the total restored.
    float applyHealing(float amount, ecs::World& world);

    // Move the party and lay members out in a centered line
    void move(const glm::vec2& target, ecs::World& world);

    // Drop dead or destroyed members. Returns the number removed.
    size_t removeDeadMembers(ecs::World& world);

    // Release every member and deactivate
    void disband(ecs::World& world);

    // Healing cadence, driven by PartyCombatSystem
    float healCooldown = 0.0f;

private:
    void release(ecs::Entity entity, ecs::World& world);

    uint32_t id_;
    int32_t floorIndex_;
    glm::vec2 position_;
    float formationSpacing_;
    bool active_ = true;

    std::vector<ecs::Entity> members_;
    std::optional<Affiliation> affiliation_;
};
