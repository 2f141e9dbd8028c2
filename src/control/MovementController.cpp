#include "control/MovementController.h"
#include "util/Logger.h"

#include <algorithm>

MovementController::MovementController(const SimulationConfig& cfg)
    : config(cfg)
{
}

bool MovementController::advanceToward(Drone& drone, const Vec2& target, double dt) const {
    // Positions are clamped, so a goal outside the world could never be met.
    const Vec2 goal = clampToWorld(target);
    Vec2 delta = goal - drone.position;
    double dist = glm::length(delta);

    if (dist <= config.arrivalThreshold) {
        drone.position = goal;
        drone.velocity = Vec2(0.0);
        return true;
    }

    drone.velocity = (delta / dist) * config.speedFor(drone.team);
    drone.position = clampToWorld(drone.position + drone.velocity * dt);
    return false;
}

Vec2 MovementController::clampToWorld(const Vec2& p) const {
    if (!config.clampToWorld) return p;
    return Vec2(std::clamp(p.x, 0.0, config.worldWidth),
        std::clamp(p.y, 0.0, config.worldHeight));
}

void MovementController::update(WorldState& world, double dt) {
    for (auto& [id, d] : world.drones) {
        bool moving = d.mode == DroneMode::MOVING || d.mode == DroneMode::RETURNING;
        if (!moving || !d.target) continue;

        if (!advanceToward(d, *d.target, dt)) continue;

        // Still part of an unresolved group: report in and wait for the rest.
        if (d.mode == DroneMode::MOVING && d.groupId) {
            auto git = world.groups.find(*d.groupId);
            if (git != world.groups.end()) {
                if (git->second.arrivedIds.insert(id).second) {
                    Log::control("[ARRIVE] ", id, " reached group ", git->first,
                        " destination at tick ", world.tick, "\n");
                }
                continue;
            }
            d.groupId.reset();
        }

        Log::control("[ARRIVE] ", id, " ", toString(d.mode), " -> idle at tick ",
            world.tick, "\n");
        d.mode = DroneMode::IDLE;
        d.target.reset();
    }
}
