#include "control/PatternFollower.h"
#include "control/PatternMotion.h"
#include "util/Logger.h"

PatternFollower::PatternFollower(const SimulationConfig& cfg,
    const MovementController& movement)
    : config(cfg), movement(movement)
{
}

void PatternFollower::update(WorldState& world, double dt) {
    for (auto& [id, d] : world.drones) {
        if (d.mode != DroneMode::PATROLLING) continue;
        if (d.pattern.kind == PatternKind::NONE) {
            d.velocity = Vec2(0.0);
            continue;
        }

        // Still flying to the entry point.
        if (d.target) {
            if (movement.advanceToward(d, *d.target, dt)) {
                d.pattern = PatternMotion::alignTo(d.pattern, d.position);
                d.target.reset();
                Log::control("[PATROL] ", id, " joined pattern at tick ", world.tick, "\n");
            }
            continue;
        }

        Vec2 before = d.position;
        auto next = PatternMotion::advance(d.pattern, d.position,
            config.speedFor(d.team), dt);
        d.position = next.position;
        d.pattern = next.pattern;
        d.velocity = (d.position - before) / dt;
    }
}
