#include "control/CollisionResolver.h"
#include "util/Logger.h"

#include <algorithm>
#include <tuple>
#include <unordered_set>

namespace CollisionResolver {

    std::vector<CollisionEvent> detect(const WorldState& world) {
        std::vector<CollisionEvent> candidates;

        for (const auto& [fid, f] : world.drones) {
            if (!f.isFriendly()) continue;
            for (const auto& [eid, e] : world.drones) {
                if (!e.isEnemy()) continue;

                double dist = glm::distance(f.position, e.position);
                if (dist < f.radius + e.radius) {
                    candidates.push_back(CollisionEvent{ fid, eid, dist });
                }
            }
        }

        std::sort(candidates.begin(), candidates.end(),
            [](const CollisionEvent& a, const CollisionEvent& b) {
                return std::tie(a.distance, a.friendlyId, a.enemyId)
                    < std::tie(b.distance, b.friendlyId, b.enemyId);
            });

        std::vector<CollisionEvent> matched;
        std::unordered_set<std::string> used;
        for (const auto& c : candidates) {
            if (used.count(c.friendlyId) || used.count(c.enemyId)) continue;
            used.insert(c.friendlyId);
            used.insert(c.enemyId);
            matched.push_back(c);
        }
        return matched;
    }

    std::vector<CollisionEvent> resolve(WorldState& world) {
        auto events = detect(world);

        for (const auto& ev : events) {
            Log::collision("[COLLISION] ", ev.friendlyId, " x ", ev.enemyId,
                " (d=", ev.distance, ") at tick ", world.tick, "\n");
            world.removeDrone(ev.friendlyId);
            world.removeDrone(ev.enemyId);
        }
        return events;
    }

} // namespace CollisionResolver
