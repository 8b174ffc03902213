#pragma once

#include "floor/FloorGridLogic.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Notification emitted by the simulation core for the presentation layer
struct DungeonEvent {
    std::string name;               // Event identifier (see DungeonEvents)
    int32_t floorIndex = 0;         // Floor the event refers to, 0 if none
    FloorGrid::GridCell cell;       // Wall cell for wall events
    uint32_t partyId = 0;           // Party for party events, 0 if none
    float amount = 0.0f;            // Damage / healing amount
    std::string message;            // Human readable detail (errors)
};

// Built-in event names
namespace DungeonEvents {
    constexpr const char* FLOOR_CREATED = "floor_created";
    constexpr const char* FLOOR_EXPANDED = "floor_expanded";
    constexpr const char* VIEW_FLOOR_CHANGED = "view_floor_changed";
    // Fired when a monster or invader enters a floor
    constexpr const char* OCCUPANT_ARRIVED = "occupant_arrived";

    constexpr const char* RENOVATION_STARTED = "renovation_started";
    constexpr const char* RENOVATION_ENDED = "renovation_ended";
    constexpr const char* RENOVATION_ERROR = "renovation_error";
    constexpr const char* WALL_PLACED = "wall_placed";
    constexpr const char* WALL_REMOVED = "wall_removed";
    constexpr const char* LAYOUT_SAVED = "layout_saved";

    constexpr const char* PARTY_CREATED = "party_created";
    constexpr const char* PARTY_DISBANDED = "party_disbanded";
    constexpr const char* PARTY_DAMAGED = "party_damaged";
    constexpr const char* PARTY_HEALED = "party_healed";
}

using DungeonEventCallback = std::function<void(const DungeonEvent&)>;

// Interface for receiving dungeon events
class IDungeonEventListener {
public:
    virtual ~IDungeonEventListener() = default;

    virtual void onDungeonEvent(const DungeonEvent& event) = 0;
};

// Dispatcher shared by all systems. Listeners are notified in registration
// order, callbacks before interface listeners.
class DungeonEventDispatcher {
public:
    DungeonEventDispatcher() = default;

    DungeonEventDispatcher(const DungeonEventDispatcher&) = delete;
    DungeonEventDispatcher& operator=(const DungeonEventDispatcher&) = delete;

    // Returns an ID that can be used to remove the listener
    uint32_t addListener(DungeonEventCallback callback) {
        uint32_t id = nextListenerId++;
        callbacks.push_back({id, std::move(callback)});
        return id;
    }

    // Interface listeners are not owned by the dispatcher
    void addListener(IDungeonEventListener* listener) {
        if (listener) {
            listeners.push_back(listener);
        }
    }

    void removeListener(uint32_t id) {
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                [id](const CallbackEntry& entry) { return entry.id == id; }),
            callbacks.end()
        );
    }

    void removeListener(IDungeonEventListener* listener) {
        listeners.erase(
            std::remove(listeners.begin(), listeners.end(), listener),
            listeners.end()
        );
    }

    // Listeners may dispatch further events from inside a callback, but must
    // not add or remove listeners while being notified.
    void dispatch(const DungeonEvent& event) {
        for (size_t i = 0; i < callbacks.size(); ++i) {
            callbacks[i].callback(event);
        }
        for (size_t i = 0; i < listeners.size(); ++i) {
            listeners[i]->onDungeonEvent(event);
        }
    }

    void clear() {
        callbacks.clear();
        listeners.clear();
    }

    bool hasListeners() const {
        return !callbacks.empty() || !listeners.empty();
    }

    size_t listenerCount() const {
        return callbacks.size() + listeners.size();
    }

private:
    struct CallbackEntry {
        uint32_t id;
        DungeonEventCallback callback;
    };

    std::vector<CallbackEntry> callbacks;
    std::vector<IDungeonEventListener*> listeners;
    uint32_t nextListenerId = 1;
};
