#pragma once

#include <glm/glm.hpp>
#include <entt/entt.hpp>
#include <algorithm>
#include <cstdint>
#include <string>

// ============================================================================
// Spatial Components
// ============================================================================

// Floor-plane position of a character (grid units)
struct Position {
    glm::vec2 value{0.0f};
};

// ============================================================================
// Combat Components
// ============================================================================

// Health component for damageable entities
struct Health {
    float current{100.0f};
    float maximum{100.0f};
    bool isDead{false};

    Health() = default;
    explicit Health(float max) : current(max), maximum(max) {}

    // Returns the damage actually absorbed (never more than current health)
    float takeDamage(float amount) {
        if (isDead || amount <= 0.0f) return 0.0f;
        float absorbed = std::min(current, amount);
        current -= absorbed;
        if (current <= 0.0f) {
            current = 0.0f;
            isDead = true;
        }
        return absorbed;
    }

    // Returns the amount actually restored. The dead stay dead.
    float heal(float amount) {
        if (isDead || amount <= 0.0f) return 0.0f;
        float restored = std::min(maximum - current, amount);
        current += restored;
        return restored;
    }

    [[nodiscard]] bool isAlive() const { return !isDead && current > 0.0f; }
    [[nodiscard]] bool isInjured() const { return isAlive() && current < maximum; }

    [[nodiscard]] float percentage() const {
        return maximum > 0.0f ? current / maximum : 0.0f;
    }
};

// Mana pool for characters with abilities
struct Mana {
    float current{50.0f};
    float maximum{50.0f};

    Mana() = default;
    explicit Mana(float max) : current(max), maximum(max) {}

    // Spend mana; fails without side effects if the pool is too low
    bool consume(float amount) {
        if (amount < 0.0f || amount > current) return false;
        current -= amount;
        return true;
    }

    float restore(float amount) {
        if (amount <= 0.0f) return 0.0f;
        float restored = std::min(maximum - current, amount);
        current += restored;
        return restored;
    }
};

// Attack stat supplied by the character's archetype
struct AttackPower {
    float value{0.0f};
};

// Tag: character can heal its party
struct HealerTag {};

// Which side of the dungeon a character fights for
enum class Affiliation : uint8_t {
    Invader = 0,    // Adventurers raiding the dungeon
    Defender = 1    // Monsters owned by the dungeon
};

struct Allegiance {
    Affiliation side{Affiliation::Defender};
};

// Party the character currently belongs to (absent when solo)
struct PartyMember {
    uint32_t partyId{0};
};

// Tag: monster resting in the shelter (fast recovery)
struct InShelter {};

// Name/identifier component
struct NameTag {
    std::string name;
};

// Archetype the character was spawned from
struct Archetype {
    std::string kind;
    int32_t level{1};
};
