#pragma once

#include "Party.h"
#include "config/DungeonConfig.h"
#include "core/DungeonError.h"
#include "core/DungeonEvent.h"
#include "ecs/World.h"

#include <glm/glm.hpp>
#include <memory>
#include <vector>

using PartyResult = DungeonResult<Party>;

// PartyRegistry creates, tracks and retires parties.
// Parties are heap allocated so pointers stay valid across creation.
class PartyRegistry {
public:
    PartyRegistry(const PartyConfig& config, DungeonEventDispatcher& events);

    PartyRegistry(const PartyRegistry&) = delete;
    PartyRegistry& operator=(const PartyRegistry&) = delete;

    // Form a party on `floorIndex` from `members`. Nothing changes on failure.
    PartyResult createParty(const std::vector<ecs::Entity>& members, int32_t floorIndex, ecs::World& world);

    DungeonError disbandParty(uint32_t partyId, ecs::World& world);
    DungeonError moveParty(uint32_t partyId, const glm::vec2& target, ecs::World& world);

    Party* findParty(uint32_t partyId);
    const Party* findParty(uint32_t partyId) const;

    std::vector<Party*> partiesOnFloor(int32_t floorIndex);
    std::vector<Party*> activeParties();

    size_t partyCount() const { return parties_.size(); }
    size_t activePartyCount(int32_t floorIndex) const;

    // Drop dead members, then remove parties left inactive.
    // Returns the number of parties removed.
    size_t cleanup(ecs::World& world);

    const PartyConfig& config() const { return config_; }

private:
    void emit(const char* name, const Party& party);

    PartyConfig config_;
    DungeonEventDispatcher& events_;

    std::vector<std::unique_ptr<Party>> parties_;
    uint32_t nextPartyId_ = 1;
};
