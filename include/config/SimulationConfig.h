#pragma once
#include <cstddef>
#include <cstdint>

#include "core/Types.h"

// =============================================================================
// SimulationConfig - All the knobs and dials for the swarm simulator
//
// Every tunable the engine reads lives here with its default. Parameters are
// organized into logical groups:
//   - Global: fixed timestep
//   - World: bounds and initial scenario
//   - Drones: per-team speed, collision radius
//   - Behaviors: movement, intercept planner, tailing, formation, patrol
//   - History: ring buffer size and jump-back offset
// =============================================================================

struct SimulationConfig {

    // -------------------------------------------------------------------------
    // Global Simulation Parameters
    // -------------------------------------------------------------------------
    double timeStep = 0.02;        // Seconds per simulation tick (50 Hz)

    // -------------------------------------------------------------------------
    // World
    // -------------------------------------------------------------------------
    double worldWidth = 1000.0;
    double worldHeight = 1000.0;
    bool clampToWorld = true;            // Keep controlled drones inside bounds
    bool populateDefaultScenario = true; // Spawn default drones/bases on reset

    // -------------------------------------------------------------------------
    // Drones
    // -------------------------------------------------------------------------
    double friendlySpeed = 200.0;  // units per second
    double enemySpeed = 40.0;      // units per second
    double droneRadius = 10.0;     // collision + visual radius

    // -------------------------------------------------------------------------
    // Movement
    // -------------------------------------------------------------------------
    double arrivalThreshold = 5.0; // snap to target inside this distance

    // -------------------------------------------------------------------------
    // Predictive Intercept
    // The planner samples the target's future trajectory out to the horizon.
    // -------------------------------------------------------------------------
    double interceptHorizon = 30.0;        // seconds searched ahead
    double interceptStep = 0.1;            // sampling resolution (seconds)
    double interceptDriftThreshold = 10.0; // re-plan when prediction drifts
    int interceptRetryTicks = 25;          // re-plan cadence when no solution

    // -------------------------------------------------------------------------
    // Tailing
    // -------------------------------------------------------------------------
    double tailDeadZone = 2.0;
    double defaultTailDistance = 100.0;

    // -------------------------------------------------------------------------
    // Formation / Patrol
    // -------------------------------------------------------------------------
    double formationSpacing = 20.0;        // grid cell size on group dispersal
    double defaultPatrolRadius = 100.0;

    // -------------------------------------------------------------------------
    // History
    // -------------------------------------------------------------------------
    std::size_t historyCapacity = 500;     // snapshots kept (10 s at 50 Hz)
    std::size_t jumpBackTicks = 250;       // 5 s at 50 Hz

    double speedFor(Team team) const {
        return team == Team::ENEMY ? enemySpeed : friendlySpeed;
    }
};
