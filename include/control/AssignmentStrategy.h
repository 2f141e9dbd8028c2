#pragma once
#include <string>
#include <vector>
#include "core/Types.h"
#include "control/FormationPattern.h"

// Simple data for "where should drone i go in the formation?"
struct DroneAssignment {
    std::string droneId;
    Vec2 targetPos;
    int  logicalIndex; // 0..N-1 rank among the assigned drones
};

namespace AssignmentStrategy {

    // Given drone ids and a formation, assign each drone (in sorted id order)
    // to the slot with the same rank. Extra slots stay empty; extra drones
    // get no assignment.
    std::vector<DroneAssignment>
        assignDronesToPattern(const std::vector<std::string>& droneIds,
            const FormationPattern& pattern);

}
