#pragma once
#include "config/SimulationConfig.h"
#include "control/MovementController.h"
#include "core/WorldState.h"

// Drives PATROLLING drones along their PatternData: enemies from spawn, and
// friendly drones once they have flown to the pattern's entry point.
class PatternFollower {
public:
    PatternFollower(const SimulationConfig& cfg, const MovementController& movement);

    void update(WorldState& world, double dt);

private:
    const SimulationConfig& config;
    const MovementController& movement;
};
