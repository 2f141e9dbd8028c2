#pragma once
#include <optional>

#include "config/SimulationConfig.h"
#include "control/MovementController.h"
#include "core/WorldState.h"

struct InterceptSolution {
    Vec2 point;      // rendezvous position
    double time;     // seconds from now
};

// Brute-force predictive intercept: walk the target's predicted trajectory in
// fixed steps and take the first sample the pursuer can reach in time.
class InterceptPlanner {
public:
    InterceptPlanner(const SimulationConfig& cfg, const MovementController& movement);

    // Earliest feasible rendezvous at search resolution, or std::nullopt when
    // nothing inside the horizon is reachable ("no intercept").
    std::optional<InterceptSolution> plan(const Drone& pursuer, const Drone& target) const;

    // Per tick: drones in INTERCEPTING mode. `simTime` is the time of the
    // state being advanced. The cached solution is reused until the target's
    // predicted position drifts away from it; with no solution the drone
    // pursues the target's current position and retries periodically.
    void update(WorldState& world, double simTime, double dt);

    // Number of plan() calls made by update(); lets callers bound planner cost.
    long long getPlanCount() const { return planCount; }

private:
    const SimulationConfig& config;
    const MovementController& movement;
    long long planCount = 0;

    void replan(Drone& drone, const Drone& target, double simTime, int64_t tick);
};
