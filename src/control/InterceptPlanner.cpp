#include "control/InterceptPlanner.h"
#include "control/PatternMotion.h"
#include "util/Logger.h"

#include <algorithm>
#include <cmath>

InterceptPlanner::InterceptPlanner(const SimulationConfig& cfg,
    const MovementController& movement)
    : config(cfg), movement(movement)
{
}

std::optional<InterceptSolution> InterceptPlanner::plan(const Drone& pursuer,
    const Drone& target) const
{
    const double step = config.interceptStep;
    const double pursuerSpeed = config.speedFor(pursuer.team);
    const double targetSpeed = config.speedFor(target.team);

    if (step <= 0.0 || pursuerSpeed <= 0.0) {
        return std::nullopt;
    }

    // Sample times are k * step rather than an accumulated sum so the same
    // inputs always hit the same samples.
    const long long samples = static_cast<long long>(std::floor(config.interceptHorizon / step + 1e-9));

    for (long long k = 0; k <= samples; ++k) {
        double t = static_cast<double>(k) * step;
        Vec2 p = PatternMotion::predict(target, targetSpeed, t);
        double needed = glm::distance(p, pursuer.position) / pursuerSpeed;

        if (needed <= t + step) {
            return InterceptSolution{ p, t };
        }
    }

    return std::nullopt;
}

void InterceptPlanner::replan(Drone& drone, const Drone& target,
    double simTime, int64_t tick)
{
    ++planCount;
    auto solution = plan(drone, target);

    if (solution) {
        drone.interceptPoint = solution->point;
        drone.interceptEta = simTime + solution->time;
        Log::control("[INTERCEPT] ", drone.id, " -> ", target.id,
            " at (", solution->point.x, ", ", solution->point.y,
            ") in ", solution->time, "s\n");
        return;
    }

    drone.interceptPoint.reset();
    drone.interceptEta.reset();
    drone.nextInterceptPlanTick = tick + std::max(1, config.interceptRetryTicks);
    Log::control("[INTERCEPT] ", drone.id, " no intercept on ", target.id,
        " within ", config.interceptHorizon, "s, pursuing\n");
}

void InterceptPlanner::update(WorldState& world, double simTime, double dt) {
    for (auto& [id, d] : world.drones) {
        if (d.mode != DroneMode::INTERCEPTING) continue;

        const Drone* target = d.interceptTargetId
            ? world.findDrone(*d.interceptTargetId)
            : nullptr;
        if (!target) {
            Log::control("[INTERCEPT] ", id, " has no target, idling\n");
            d.clearTasking();
            continue;
        }

        bool needPlan = false;
        if (!d.interceptPoint) {
            needPlan = world.tick >= d.nextInterceptPlanTick;
        }
        else {
            double remaining = std::max(*d.interceptEta - simTime, 0.0);
            Vec2 predicted = PatternMotion::predict(*target,
                config.speedFor(target->team), remaining);

            bool drifted = glm::distance(predicted, *d.interceptPoint)
                > config.interceptDriftThreshold;
            bool waitedOut = simTime >= *d.interceptEta
                && glm::distance(d.position, *d.interceptPoint) <= config.arrivalThreshold;
            needPlan = drifted || waitedOut;
        }

        if (needPlan) {
            replan(d, *target, simTime, world.tick);
        }

        // Either fly to the rendezvous (and wait there), or fall back to
        // chasing the target's current position.
        const Vec2 aim = d.interceptPoint ? *d.interceptPoint : target->position;
        movement.advanceToward(d, aim, dt);
    }
}
