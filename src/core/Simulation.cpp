#include "core/Simulation.h"
#include "command/TaskRegistry.h"
#include "control/PatternMotion.h"
#include "core/Scenario.h"
#include "util/Logger.h"

#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

    const SimulationConfig& validated(const SimulationConfig& cfg) {
        if (cfg.timeStep <= 0.0) {
            throw std::invalid_argument("SimulationConfig: timeStep must be > 0");
        }
        if (cfg.historyCapacity == 0) {
            throw std::invalid_argument("SimulationConfig: historyCapacity must be > 0");
        }
        if (cfg.friendlySpeed <= 0.0 || cfg.enemySpeed <= 0.0) {
            throw std::invalid_argument("SimulationConfig: speeds must be > 0");
        }
        if (cfg.droneRadius <= 0.0) {
            throw std::invalid_argument("SimulationConfig: droneRadius must be > 0");
        }
        if (cfg.interceptStep <= 0.0 || cfg.interceptHorizon <= 0.0) {
            throw std::invalid_argument("SimulationConfig: intercept horizon/step must be > 0");
        }
        return cfg;
    }

    // Applies one typed task to the already-resolved friendly drones. Every
    // branch of the Task variant must be handled here.
    struct TaskApplier {
        WorldState& world;
        const SimulationConfig& cfg;
        const MovementController& movement;
        const std::vector<Drone*>& drones;
        CommandResult& result;

        void retask(Drone& d, DroneMode mode) {
            world.leaveGroup(d);
            d.clearTasking();
            d.mode = mode;
        }

        void operator()(const MoveTask& task) {
            const Vec2 destination = movement.clampToWorld(task.destination);
            std::vector<std::string> ids;
            for (Drone* d : drones) {
                retask(*d, DroneMode::MOVING);
                d->target = destination;
                ids.push_back(d->id);
            }
            if (!ids.empty()) {
                int gid = world.createGroup(ids, destination);
                for (Drone* d : drones) d->groupId = gid;
            }
            result.updatedDrones = static_cast<int>(drones.size());
        }

        void operator()(const PatrolTask& task) {
            for (Drone* d : drones) {
                retask(*d, DroneMode::PATROLLING);
                d->pattern = task.pattern;

                Vec2 entry = movement.clampToWorld(PatternMotion::entryPoint(task.pattern, d->position));
                if (glm::distance(entry, d->position) <= cfg.arrivalThreshold) {
                    d->pattern = PatternMotion::alignTo(task.pattern, d->position);
                }
                else {
                    d->target = entry;
                }
            }
            result.updatedDrones = static_cast<int>(drones.size());
        }

        void operator()(const TailTask& task) {
            const Drone* target = world.findDrone(task.targetId);
            if (!target || !target->isEnemy()) {
                result.ignoredIds.push_back(task.targetId);
                result.message = "tail target must be an existing enemy";
                return;
            }
            for (Drone* d : drones) {
                if (d->id == task.targetId) {
                    result.ignoredIds.push_back(d->id);
                    continue;
                }
                retask(*d, DroneMode::TAILING);
                d->tailTargetId = task.targetId;
                d->tailDistance = task.distance;
                ++result.updatedDrones;
            }
        }

        void operator()(const HoldTask&) {
            for (Drone* d : drones) {
                retask(*d, DroneMode::HOLDING);
            }
            result.updatedDrones = static_cast<int>(drones.size());
        }

        void operator()(const ReturnToBaseTask& task) {
            const Base* forced = nullptr;
            if (task.baseId) {
                forced = world.findBase(*task.baseId);
                if (!forced) {
                    result.ignoredIds.push_back(*task.baseId);
                    result.message = "base not found";
                    return;
                }
            }

            for (Drone* d : drones) {
                const Base* base = forced;
                if (!base && d->baseId) base = world.findBase(*d->baseId);
                if (!base) base = world.nearestBase(d->position);
                if (!base) {
                    result.ignoredIds.push_back(d->id);
                    continue;
                }
                retask(*d, DroneMode::RETURNING);
                d->target = movement.clampToWorld(base->position);
                ++result.updatedDrones;
            }
        }

        void operator()(const InterceptTask& task) {
            const Drone* target = world.findDrone(task.targetId);
            if (!target || !target->isEnemy()) {
                result.ignoredIds.push_back(task.targetId);
                result.message = "intercept target must be an existing enemy";
                return;
            }
            for (Drone* d : drones) {
                retask(*d, DroneMode::INTERCEPTING);
                d->interceptTargetId = task.targetId;
            }
            result.updatedDrones = static_cast<int>(drones.size());
        }
    };

    struct CommandDispatcher {
        Simulation& sim;

        CommandResult operator()(const MoveCommand& c) { return sim.issueMove(c); }
        CommandResult operator()(const TaskRequest& c) { return sim.issueTask(c); }
        CommandResult operator()(const SetBaseCommand& c) { return sim.setBase(c); }
        CommandResult operator()(const PauseCommand& c) { return sim.setPaused(c.paused); }
        CommandResult operator()(const TimeControlCommand& c) { return sim.setTimeDirection(c.direction); }
        CommandResult operator()(const JumpBackCommand&) { return sim.jumpBack(); }
        CommandResult operator()(const ResetCommand& c) {
            try {
                if (c.config) sim.reset(*c.config);
                else sim.reset();
            }
            catch (const std::invalid_argument& e) {
                return CommandResult::rejected(CommandError::SCHEMA, e.what());
            }
            return CommandResult::applied(0, "reset");
        }
    };

} // anonymous namespace

Simulation::Simulation(const SimulationConfig& config)
    : cfg(validated(config)),
    history(cfg.historyCapacity),
    movement(cfg),
    intercept(cfg, movement),
    tail(cfg, movement),
    patterns(cfg, movement),
    formation(cfg, movement)
{
    if (cfg.populateDefaultScenario) {
        Scenario::populateDefaultWorld(world, cfg);
    }
}

void Simulation::reset() {
    reset(cfg);
}

void Simulation::reset(const SimulationConfig& config) {
    // Build everything first so a bad config leaves the running world intact.
    SimulationConfig next = validated(config);
    WorldState freshWorld;
    HistoryBuffer freshHistory(next.historyCapacity);
    if (next.populateDefaultScenario) {
        Scenario::populateDefaultWorld(freshWorld, next);
    }

    cfg = next;
    world = std::move(freshWorld);
    history = std::move(freshHistory);
    lastCollisions.clear();

    Log::command("[RESET] world and history cleared, ", world.drones.size(),
        " drones spawned\n");
}

void Simulation::addDrone(const Drone& drone) {
    world.drones[drone.id] = drone;
}

void Simulation::addBase(const Base& base) {
    world.bases[base.id] = base;
}

double Simulation::getTime() const {
    return static_cast<double>(world.tick) * cfg.timeStep;
}

// =============================================================================
//   TICK
// =============================================================================

void Simulation::step() {
    applyMailbox();

    switch (world.clockState()) {
    case ClockState::PAUSED:
        return;
    case ClockState::REVERSING:
        stepReverse();
        return;
    case ClockState::RUNNING_FORWARD:
        stepForward();
        return;
    }
}

void Simulation::stepForward() {
    const double dt = cfg.timeStep;
    const double stateTime = static_cast<double>(world.tick) * dt;

    ++world.tick;

    // 1. Behavior controllers, each picking its drones by mode.
    movement.update(world, dt);
    intercept.update(world, stateTime, dt);
    tail.update(world, dt);
    patterns.update(world, dt);

    // 2. Destructive collisions.
    lastCollisions = CollisionResolver::resolve(world);

    // 3. Group arrival / dispersal.
    formation.update(world);

    // 4. Record.
    history.push(world);
}

void Simulation::stepReverse() {
    lastCollisions.clear();
    if (!history.stepBack(world)) {
        return;   // at the oldest snapshot; stay put until told otherwise
    }
    Log::history("[HISTORY] reversed to tick ", world.tick, "\n");
}

void Simulation::applyMailbox() {
    for (const auto& command : mailbox.drain()) {
        CommandResult result = apply(command);
        if (resultCallback) {
            resultCallback(command, result);
        }
    }
}

// =============================================================================
//   BOUNDARY OPERATIONS
// =============================================================================

WorldView Simulation::queryWorld() const {
    WorldView view;
    view.tick = world.tick;
    view.time = getTime();
    view.clock = world.clockState();
    view.historySize = history.size();

    view.drones.reserve(world.drones.size());
    for (const auto& [id, d] : world.drones) {
        view.drones.push_back(DroneView{ d.id, d.team, d.position, d.velocity,
            d.mode, d.target, d.baseId });
    }
    for (const auto& [id, b] : world.bases) {
        view.bases.push_back(b);
    }
    return view;
}

CommandResult Simulation::assignTask(const Task& task, const std::vector<std::string>& droneIds) {
    CommandResult result = CommandResult::applied(0);

    // Resolve ids; unknown and non-friendly ids are skipped, not errors.
    std::vector<Drone*> drones;
    std::set<std::string> seen;
    for (const auto& id : droneIds) {
        if (!seen.insert(id).second) continue;
        Drone* d = world.findDrone(id);
        if (!d || !d->isFriendly()) {
            result.ignoredIds.push_back(id);
            continue;
        }
        drones.push_back(d);
    }

    std::visit(TaskApplier{ world, cfg, movement, drones, result }, task);

    Log::command("[TASK] ", toString(kindOf(task)), " -> ", result.updatedDrones,
        " drones", result.ignoredIds.empty() ? "" : " (some ids ignored)", "\n");
    return result;
}

CommandResult Simulation::issueMove(const MoveCommand& cmd) {
    if (cmd.droneIds.empty()) {
        return CommandResult::rejected(CommandError::SCHEMA, "move needs at least one drone id");
    }
    if (!std::isfinite(cmd.targetX) || !std::isfinite(cmd.targetY)) {
        return CommandResult::rejected(CommandError::SCHEMA, "move target must be finite");
    }
    return assignTask(MoveTask{ Vec2(cmd.targetX, cmd.targetY) }, cmd.droneIds);
}

CommandResult Simulation::issueTask(const TaskRequest& request) {
    TaskParseResult parsed = TaskRegistry::parse(request, cfg);
    if (!parsed.ok()) {
        Log::command("[TASK] rejected (", toString(parsed.error.error), "): ",
            parsed.error.message, "\n");
        return parsed.error;
    }
    return assignTask(*parsed.task, request.droneIds);
}

CommandResult Simulation::setBase(const SetBaseCommand& cmd) {
    CommandResult result = CommandResult::applied(0);

    if (!world.findBase(cmd.baseId)) {
        result.ignoredIds.push_back(cmd.baseId);
        result.message = "base not found";
        return result;
    }

    for (const auto& id : cmd.droneIds) {
        Drone* d = world.findDrone(id);
        if (!d) {
            result.ignoredIds.push_back(id);
            continue;
        }
        d->baseId = cmd.baseId;
        ++result.updatedDrones;
    }
    return result;
}

CommandResult Simulation::setPaused(bool paused) {
    world.paused = paused;
    if (!paused) {
        world.direction = TimeDirection::FORWARD;
    }
    Log::command("[CLOCK] ", toString(world.clockState()), "\n");
    return CommandResult::applied(0, toString(world.clockState()));
}

CommandResult Simulation::setTimeDirection(TimeDirection direction) {
    world.paused = false;
    world.direction = direction;
    Log::command("[CLOCK] ", toString(world.clockState()), "\n");
    return CommandResult::applied(0, toString(world.clockState()));
}

CommandResult Simulation::jumpBack() {
    if (!history.jumpBack(cfg.jumpBackTicks, world)) {
        return CommandResult::applied(0, "history empty");
    }
    world.paused = false;
    world.direction = TimeDirection::FORWARD;
    return CommandResult::applied(0, "resumed at tick " + std::to_string(world.tick));
}

CommandResult Simulation::apply(const ControlCommand& command) {
    return std::visit(CommandDispatcher{ *this }, command);
}
