#include "DungeonError.h"

const char* toString(DungeonError error) {
    switch (error) {
        case DungeonError::None:                return "None";
        case DungeonError::InvalidIndex:        return "InvalidIndex";
        case DungeonError::MaxFloorsReached:    return "MaxFloorsReached";
        case DungeonError::PlacementBlocked:    return "PlacementBlocked";
        case DungeonError::NotInSession:        return "NotInSession";
        case DungeonError::SessionActive:       return "SessionActive";
        case DungeonError::OccupiedFloor:       return "OccupiedFloor";
        case DungeonError::StairClearance:      return "StairClearance";
        case DungeonError::AlreadyWalled:       return "AlreadyWalled";
        case DungeonError::NoWall:              return "NoWall";
        case DungeonError::PathBlocked:         return "PathBlocked";
        case DungeonError::EmptyParty:          return "EmptyParty";
        case DungeonError::FloorPartyLimit:     return "FloorPartyLimit";
        case DungeonError::UnknownParty:        return "UnknownParty";
        case DungeonError::InvalidEntity:       return "InvalidEntity";
        case DungeonError::AlreadyInParty:      return "AlreadyInParty";
        case DungeonError::NotAMember:          return "NotAMember";
        case DungeonError::AffiliationMismatch: return "AffiliationMismatch";
    }
    return "Unknown";
}

const char* describe(DungeonError error) {
    switch (error) {
        case DungeonError::None:
            return "OK";
        case DungeonError::InvalidIndex:
            return "That floor does not exist.";
        case DungeonError::MaxFloorsReached:
            return "The dungeon cannot grow any deeper.";
        case DungeonError::PlacementBlocked:
            return "A monster cannot be placed there.";
        case DungeonError::NotInSession:
            return "Renovation mode is not active.";
        case DungeonError::SessionActive:
            return "Another floor is already being renovated.";
        case DungeonError::OccupiedFloor:
            return "Only an empty floor can be renovated. Monsters or invaders are present.";
        case DungeonError::StairClearance:
            return "Walls cannot be placed on a staircase.";
        case DungeonError::AlreadyWalled:
            return "There is already a wall there.";
        case DungeonError::NoWall:
            return "There is no wall there.";
        case DungeonError::PathBlocked:
            return "That wall would cut off the path between the stairs.";
        case DungeonError::EmptyParty:
            return "A party needs at least one member.";
        case DungeonError::FloorPartyLimit:
            return "This floor cannot hold any more parties.";
        case DungeonError::UnknownParty:
            return "That party no longer exists.";
        case DungeonError::InvalidEntity:
            return "That character cannot fight.";
        case DungeonError::AlreadyInParty:
            return "That character already belongs to a party.";
        case DungeonError::NotAMember:
            return "That character is not in this party.";
        case DungeonError::AffiliationMismatch:
            return "Invaders and defenders cannot share a party.";
    }
    return "Unknown error.";
}
