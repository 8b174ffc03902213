#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Monster kinds available to the dungeon owner from the start
enum class MonsterKind : uint8_t {
    Slime = 0,
    LesserSkeleton,
    LesserGhost,
    LesserGolem,
    Goblin,
    LesserWolf
};

// Adventurer classes that raid the dungeon
enum class InvaderKind : uint8_t {
    Warrior = 0,
    Mage,
    Rogue,
    Cleric
};

// Level-scaled stats handed to the entity factory
struct CharacterStats {
    float maxHealth = 100.0f;
    float maxMana = 0.0f;          // 0 = no mana pool
    float attackPower = 20.0f;
    bool healer = false;
};

namespace Archetypes {

// Monster base stats: 100 HP, 50 MP, 20 ATK.
// HP and MP grow 10% per level, attack 15% per level.
CharacterStats monsterStats(MonsterKind kind, int32_t level);

// Invader base stats: 80 HP, 15 ATK, no mana. Both grow 20% per level.
CharacterStats invaderStats(InvaderKind kind, int32_t level);

const char* toString(MonsterKind kind);
const char* toString(InvaderKind kind);

std::optional<MonsterKind> parseMonsterKind(const std::string& name);
std::optional<InvaderKind> parseInvaderKind(const std::string& name);

} // namespace Archetypes
