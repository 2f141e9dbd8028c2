#include "control/FormationCoordinator.h"
#include "control/AssignmentStrategy.h"
#include "control/FormationPattern.h"
#include "util/Logger.h"

FormationCoordinator::FormationCoordinator(const SimulationConfig& cfg,
    const MovementController& movement)
    : config(cfg), movement(movement)
{
}

std::vector<int> FormationCoordinator::update(WorldState& world) {
    std::vector<int> dispersed;

    for (auto it = world.groups.begin(); it != world.groups.end(); ) {
        const CommandGroup& group = it->second;

        if (group.memberIds.empty()) {
            it = world.groups.erase(it);
            continue;
        }

        if (!group.isResolved()) {
            ++it;
            continue;
        }

        disperse(world, group);
        dispersed.push_back(it->first);
        it = world.groups.erase(it);
    }

    return dispersed;
}

void FormationCoordinator::disperse(WorldState& world, const CommandGroup& group) {
    std::vector<std::string> ids(group.memberIds.begin(), group.memberIds.end());

    FormationPattern grid = FormationPattern::makeGrid(
        "group_" + std::to_string(group.groupId),
        group.destination,
        static_cast<int>(ids.size()),
        config.formationSpacing);

    auto assignments = AssignmentStrategy::assignDronesToPattern(ids, grid);

    Log::control("[GROUP] group ", group.groupId, " resolved with ", ids.size(),
        " drones, dispersing at tick ", world.tick, "\n");

    for (const auto& a : assignments) {
        Drone* d = world.findDrone(a.droneId);
        if (!d) continue;

        d->groupId.reset();
        d->velocity = Vec2(0.0);

        // Cells of a grid centered near an edge may hang outside the world.
        const Vec2 cell = movement.clampToWorld(a.targetPos);

        // A lone drone's cell is the destination it is already sitting on.
        if (glm::distance(d->position, cell) <= config.arrivalThreshold) {
            d->position = cell;
            d->target.reset();
            d->mode = DroneMode::IDLE;
        }
        else {
            d->target = cell;
            d->mode = DroneMode::MOVING;
        }
    }
}
