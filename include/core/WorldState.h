#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/Drone.h"

enum class BaseShape {
    SQUARE,
    CIRCLE,
    TRIANGLE
};

struct Base {
    std::string id;
    Vec2 position{ 0.0 };
    BaseShape shape = BaseShape::SQUARE;
    std::string name;

    bool operator==(const Base& other) const {
        return id == other.id && position == other.position
            && shape == other.shape && name == other.name;
    }
};

// Drones issued one move command together. Members only ever leave the group
// (destroyed or re-tasked); nobody joins after creation.
struct CommandGroup {
    int groupId = 0;
    std::set<std::string> memberIds;
    Vec2 destination{ 0.0 };
    std::set<std::string> arrivedIds;

    bool isResolved() const;

    bool operator==(const CommandGroup& other) const {
        return groupId == other.groupId && memberIds == other.memberIds
            && destination == other.destination && arrivedIds == other.arrivedIds;
    }
};

// The single owned aggregate every controller mutates. Ordered maps keep the
// iteration order (and therefore every tick) deterministic.
struct WorldState {
    int64_t tick = 0;
    std::map<std::string, Drone> drones;
    std::map<std::string, Base> bases;
    std::map<int, CommandGroup> groups;

    bool paused = false;
    TimeDirection direction = TimeDirection::FORWARD;
    int nextGroupId = 1;

    ClockState clockState() const;

    Drone* findDrone(const std::string& id);
    const Drone* findDrone(const std::string& id) const;
    const Base* findBase(const std::string& id) const;

    // Nearest base to a point, or nullptr when there are no bases.
    const Base* nearestBase(const Vec2& point) const;

    // Allocate a group for the given drones heading to destination.
    int createGroup(const std::vector<std::string>& memberIds, const Vec2& destination);

    // Pull a drone out of whatever group holds it; empty groups are discarded.
    void leaveGroup(Drone& drone);

    // Remove a drone and cascade: group membership and any tail/intercept
    // linkage pointing at it.
    void removeDrone(const std::string& id);
};
