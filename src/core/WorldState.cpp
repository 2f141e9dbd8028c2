#include "core/WorldState.h"
#include "util/Logger.h"

#include <algorithm>
#include <limits>

bool CommandGroup::isResolved() const {
    if (memberIds.empty()) return false;
    return std::includes(arrivedIds.begin(), arrivedIds.end(),
        memberIds.begin(), memberIds.end());
}

ClockState WorldState::clockState() const {
    if (paused) return ClockState::PAUSED;
    return direction == TimeDirection::REVERSE
        ? ClockState::REVERSING
        : ClockState::RUNNING_FORWARD;
}

Drone* WorldState::findDrone(const std::string& id) {
    auto it = drones.find(id);
    return it == drones.end() ? nullptr : &it->second;
}

const Drone* WorldState::findDrone(const std::string& id) const {
    auto it = drones.find(id);
    return it == drones.end() ? nullptr : &it->second;
}

const Base* WorldState::findBase(const std::string& id) const {
    auto it = bases.find(id);
    return it == bases.end() ? nullptr : &it->second;
}

const Base* WorldState::nearestBase(const Vec2& point) const {
    const Base* best = nullptr;
    double bestDist = std::numeric_limits<double>::max();
    for (const auto& [id, base] : bases) {
        double d = glm::distance(point, base.position);
        if (d < bestDist) {
            bestDist = d;
            best = &base;
        }
    }
    return best;
}

int WorldState::createGroup(const std::vector<std::string>& memberIds,
    const Vec2& destination)
{
    CommandGroup group;
    group.groupId = nextGroupId++;
    group.destination = destination;
    group.memberIds.insert(memberIds.begin(), memberIds.end());

    int gid = group.groupId;
    groups.emplace(gid, std::move(group));
    return gid;
}

void WorldState::leaveGroup(Drone& drone) {
    if (!drone.groupId) return;

    auto it = groups.find(*drone.groupId);
    drone.groupId.reset();
    if (it == groups.end()) return;

    it->second.memberIds.erase(drone.id);
    it->second.arrivedIds.erase(drone.id);
    if (it->second.memberIds.empty()) {
        Log::control("[GROUP] group ", it->first, " discarded (no members left)\n");
        groups.erase(it);
    }
}

void WorldState::removeDrone(const std::string& id) {
    auto it = drones.find(id);
    if (it == drones.end()) return;

    leaveGroup(it->second);
    drones.erase(it);

    // Anyone chasing the removed drone loses the link and stops.
    for (auto& [otherId, other] : drones) {
        bool linked = (other.tailTargetId && *other.tailTargetId == id)
            || (other.interceptTargetId && *other.interceptTargetId == id);
        if (linked) {
            Log::control("[LINK] ", otherId, " lost target ", id, "\n");
            leaveGroup(other);
            other.clearTasking();
        }
    }
}
