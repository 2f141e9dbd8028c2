#pragma once
#include <glm/glm.hpp>

// World coordinates live on a 2D plane; double precision keeps long
// fixed-step runs and rewinds reproducible.
using Vec2 = glm::dvec2;

enum class Team {
    FRIENDLY,
    ENEMY
};

enum class DroneMode {
    IDLE,
    MOVING,
    PATROLLING,
    TAILING,
    INTERCEPTING,
    HOLDING,
    RETURNING,
    DESTROYED
};

enum class TimeDirection {
    FORWARD,
    REVERSE
};

enum class ClockState {
    RUNNING_FORWARD,
    PAUSED,
    REVERSING
};

const char* toString(Team team);
const char* toString(DroneMode mode);
const char* toString(ClockState state);
