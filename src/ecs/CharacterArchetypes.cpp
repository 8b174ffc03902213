#include "CharacterArchetypes.h"

#include <algorithm>

namespace Archetypes {

namespace {

constexpr float MONSTER_BASE_HEALTH = 100.0f;
constexpr float MONSTER_BASE_MANA = 50.0f;
constexpr float MONSTER_BASE_ATTACK = 20.0f;

constexpr float INVADER_BASE_HEALTH = 80.0f;
constexpr float INVADER_BASE_ATTACK = 15.0f;

float levelScale(int32_t level, float perLevel) {
    int32_t clamped = std::max(level, 1);
    return 1.0f + static_cast<float>(clamped - 1) * perLevel;
}

} // anonymous namespace

CharacterStats monsterStats(MonsterKind kind, int32_t level) {
    CharacterStats stats;
    stats.maxHealth = MONSTER_BASE_HEALTH * levelScale(level, 0.1f);
    stats.maxMana = MONSTER_BASE_MANA * levelScale(level, 0.1f);
    stats.attackPower = MONSTER_BASE_ATTACK * levelScale(level, 0.15f);
    // Slimes carry the auto-heal ability
    stats.healer = (kind == MonsterKind::Slime);
    return stats;
}

CharacterStats invaderStats(InvaderKind kind, int32_t level) {
    CharacterStats stats;
    stats.maxHealth = INVADER_BASE_HEALTH * levelScale(level, 0.2f);
    stats.maxMana = 0.0f;
    stats.attackPower = INVADER_BASE_ATTACK * levelScale(level, 0.2f);
    stats.healer = (kind == InvaderKind::Cleric);
    return stats;
}

const char* toString(MonsterKind kind) {
    switch (kind) {
        case MonsterKind::Slime:          return "Slime";
        case MonsterKind::LesserSkeleton: return "LesserSkeleton";
        case MonsterKind::LesserGhost:    return "LesserGhost";
        case MonsterKind::LesserGolem:    return "LesserGolem";
        case MonsterKind::Goblin:         return "Goblin";
        case MonsterKind::LesserWolf:     return "LesserWolf";
    }
    return "Unknown";
}

const char* toString(InvaderKind kind) {
    switch (kind) {
        case InvaderKind::Warrior: return "Warrior";
        case InvaderKind::Mage:    return "Mage";
        case InvaderKind::Rogue:   return "Rogue";
        case InvaderKind::Cleric:  return "Cleric";
    }
    return "Unknown";
}

std::optional<MonsterKind> parseMonsterKind(const std::string& name) {
    for (auto kind : {MonsterKind::Slime, MonsterKind::LesserSkeleton, MonsterKind::LesserGhost,
                      MonsterKind::LesserGolem, MonsterKind::Goblin, MonsterKind::LesserWolf}) {
        if (name == toString(kind)) return kind;
    }
    return std::nullopt;
}

std::optional<InvaderKind> parseInvaderKind(const std::string& name) {
    for (auto kind : {InvaderKind::Warrior, InvaderKind::Mage, InvaderKind::Rogue, InvaderKind::Cleric}) {
        if (name == toString(kind)) return kind;
    }
    return std::nullopt;
}

} // namespace Archetypes
