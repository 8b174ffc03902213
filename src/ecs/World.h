#pragma once

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include "Components.h"
#include "CharacterArchetypes.h"

namespace ecs {

using Entity = entt::entity;

// World class - manages the ECS registry and provides convenience methods
class World {
public:
    World() = default;
    ~World() = default;

    // Non-copyable, movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = default;
    World& operator=(World&&) = default;

    // Access to underlying registry
    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    Entity create() {
        return registry_.create();
    }

    void destroy(Entity entity) {
        if (registry_.valid(entity)) {
            registry_.destroy(entity);
        }
    }

    bool valid(Entity entity) const {
        return registry_.valid(entity);
    }

    template <typename T, typename... Args>
    T& add(Entity entity, Args&&... args) {
        return registry_.emplace_or_replace<T>(entity, std::forward<Args>(args)...);
    }

    template <typename T>
    void remove(Entity entity) {
        registry_.remove<T>(entity);
    }

    template <typename T>
    bool has(Entity entity) const {
        return registry_.valid(entity) && registry_.all_of<T>(entity);
    }

    template <typename T>
    T& get(Entity entity) {
        return registry_.get<T>(entity);
    }

    template <typename T>
    const T& get(Entity entity) const {
        return registry_.get<T>(entity);
    }

    template <typename T>
    T* tryGet(Entity entity) {
        return registry_.valid(entity) ? registry_.try_get<T>(entity) : nullptr;
    }

    template <typename T>
    const T* tryGet(Entity entity) const {
        return registry_.valid(entity) ? registry_.try_get<T>(entity) : nullptr;
    }

    // Create a monster with all combat components
    Entity createMonster(MonsterKind kind, int32_t level = 1,
                         const glm::vec2& position = glm::vec2{0.0f}) {
        return createCharacter(Archetypes::monsterStats(kind, level), Affiliation::Defender,
                               Archetypes::toString(kind), level, position);
    }

    // Create an invader with all combat components
    Entity createInvader(InvaderKind kind, int32_t level = 1,
                         const glm::vec2& position = glm::vec2{0.0f}) {
        return createCharacter(Archetypes::invaderStats(kind, level), Affiliation::Invader,
                               Archetypes::toString(kind), level, position);
    }

    // Create a character from explicit stats (custom units, tests)
    Entity createCharacter(const CharacterStats& stats, Affiliation side,
                           const std::string& kindName = "Custom", int32_t level = 1,
                           const glm::vec2& position = glm::vec2{0.0f}) {
        auto entity = registry_.create();

        registry_.emplace<Position>(entity, Position{position});
        registry_.emplace<Health>(entity, Health{stats.maxHealth});
        registry_.emplace<AttackPower>(entity, AttackPower{stats.attackPower});
        registry_.emplace<Allegiance>(entity, Allegiance{side});
        registry_.emplace<Archetype>(entity, Archetype{kindName, level});

        if (stats.maxMana > 0.0f) {
            registry_.emplace<Mana>(entity, Mana{stats.maxMana});
        }
        if (stats.healer) {
            registry_.emplace<HealerTag>(entity);
        }

        return entity;
    }

    // True if the entity carries everything party combat needs
    bool isCombatant(Entity entity) const {
        return registry_.valid(entity) &&
               registry_.all_of<Position, Health, AttackPower, Allegiance>(entity);
    }

    bool isAlive(Entity entity) const {
        const auto* health = tryGet<Health>(entity);
        return health && health->isAlive();
    }

    glm::vec2 getPosition(Entity entity) const {
        if (const auto* pos = tryGet<Position>(entity)) {
            return pos->value;
        }
        return glm::vec2{0.0f};
    }

    void setPosition(Entity entity, const glm::vec2& position) {
        if (auto* pos = tryGet<Position>(entity)) {
            pos->value = position;
        }
    }

private:
    entt::registry registry_;
};

} // namespace ecs
