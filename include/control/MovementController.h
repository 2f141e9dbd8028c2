#pragma once
#include "config/SimulationConfig.h"
#include "core/WorldState.h"

// Constant-speed point-to-point motion. No deceleration curve: a drone runs at
// full team speed until it is inside arrivalThreshold, then snaps.
class MovementController {
public:
    explicit MovementController(const SimulationConfig& cfg);

    // Advance one drone one tick toward `target` (clamped to the world).
    // Returns true when the drone was inside the arrival threshold and has
    // been snapped onto the target with zero velocity.
    bool advanceToward(Drone& drone, const Vec2& target, double dt) const;

    // Keep a point inside the world when clamping is enabled.
    Vec2 clampToWorld(const Vec2& p) const;

    // Per tick: drones in MOVING or RETURNING mode. Group members report
    // arrival into their group and stay MOVING until the group resolves.
    void update(WorldState& world, double dt);

private:
    const SimulationConfig& config;
};
