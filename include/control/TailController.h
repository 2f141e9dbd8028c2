#pragma once
#include "config/SimulationConfig.h"
#include "control/MovementController.h"
#include "core/WorldState.h"

// Standoff keeping with a dead zone: hold inside +-tailDeadZone of the
// requested distance, otherwise close or open range at full speed along the
// line of sight. Tailing drones ignore each other.
class TailController {
public:
    TailController(const SimulationConfig& cfg, const MovementController& movement);

    // Velocity for one drone tailing `target`; zero inside the dead zone.
    Vec2 computeVelocity(const Drone& drone, const Drone& target) const;

    // Per tick: drones in TAILING mode.
    void update(WorldState& world, double dt);

private:
    const SimulationConfig& config;
    const MovementController& movement;
};
