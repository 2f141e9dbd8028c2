#pragma once
#include "config/SimulationConfig.h"
#include "core/WorldState.h"

namespace Scenario {

    // Initial world: a 4x3 block of friendly drones (drone_1..drone_12), three
    // patterned enemies (bounce-x, bounce-y, circular) and three bases. Each
    // friendly drone is homed on its nearest base.
    void populateDefaultWorld(WorldState& world, const SimulationConfig& cfg);

    // Helpers for building custom worlds.
    Drone makeFriendly(const std::string& id, const Vec2& pos, const SimulationConfig& cfg);
    Drone makeEnemy(const std::string& id, const Vec2& pos, const PatternData& pattern,
        const SimulationConfig& cfg);

}
