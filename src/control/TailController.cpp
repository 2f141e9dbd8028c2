#include "control/TailController.h"
#include "util/Logger.h"

#include <cmath>

TailController::TailController(const SimulationConfig& cfg,
    const MovementController& movement)
    : config(cfg), movement(movement)
{
}

Vec2 TailController::computeVelocity(const Drone& drone, const Drone& target) const {
    Vec2 delta = target.position - drone.position;
    double dist = glm::length(delta);
    double error = dist - drone.tailDistance;

    if (std::fabs(error) <= config.tailDeadZone || dist < 1e-9) {
        return Vec2(0.0);
    }

    Vec2 dir = delta / dist;
    double speed = config.speedFor(drone.team);

    // Too far: close in. Too close: back off.
    return (error > 0.0 ? dir : -dir) * speed;
}

void TailController::update(WorldState& world, double dt) {
    for (auto& [id, d] : world.drones) {
        if (d.mode != DroneMode::TAILING) continue;

        const Drone* target = d.tailTargetId ? world.findDrone(*d.tailTargetId) : nullptr;
        if (!target) {
            Log::control("[TAIL] ", id, " has no target, idling\n");
            d.clearTasking();
            continue;
        }

        d.velocity = computeVelocity(d, *target);
        d.position = movement.clampToWorld(d.position + d.velocity * dt);
    }
}
