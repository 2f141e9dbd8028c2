#pragma once
#include <vector>

#include "config/SimulationConfig.h"
#include "control/MovementController.h"
#include "core/WorldState.h"

// Watches CommandGroups. Once every surviving member has reported arrival the
// group is dispersed into a grid around its destination and discarded.
class FormationCoordinator {
public:
    FormationCoordinator(const SimulationConfig& cfg, const MovementController& movement);

    // Returns the ids of the groups dispersed this tick.
    std::vector<int> update(WorldState& world);

private:
    const SimulationConfig& config;
    const MovementController& movement;

    void disperse(WorldState& world, const CommandGroup& group);
};
