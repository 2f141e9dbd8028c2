#pragma once
#include <string>
#include <vector>

#include "core/WorldState.h"

struct CollisionEvent {
    std::string friendlyId;
    std::string enemyId;
    double distance;
};

// Destructive friendly-vs-enemy proximity collisions.
//
// All overlapping (friendly, enemy) pairs are gathered first. Pairs are then
// matched one-to-one, nearest first (ties by friendly id, then enemy id), so a
// drone overlapping several opponents takes out only the closest one and
// every drone is destroyed at most once. Removal happens after matching.
namespace CollisionResolver {

    // Matched pairs for the current positions; does not modify the world.
    std::vector<CollisionEvent> detect(const WorldState& world);

    // detect() and remove both members of every matched pair.
    std::vector<CollisionEvent> resolve(WorldState& world);

}
