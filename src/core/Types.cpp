#include "core/Types.h"

const char* toString(Team team) {
    switch (team) {
    case Team::FRIENDLY: return "friendly";
    case Team::ENEMY:    return "enemy";
    }
    return "unknown";
}

const char* toString(DroneMode mode) {
    switch (mode) {
    case DroneMode::IDLE:         return "idle";
    case DroneMode::MOVING:       return "moving";
    case DroneMode::PATROLLING:   return "patrolling";
    case DroneMode::TAILING:      return "tailing";
    case DroneMode::INTERCEPTING: return "intercepting";
    case DroneMode::HOLDING:      return "holding";
    case DroneMode::RETURNING:    return "returning";
    case DroneMode::DESTROYED:    return "destroyed";
    }
    return "unknown";
}

const char* toString(ClockState state) {
    switch (state) {
    case ClockState::RUNNING_FORWARD: return "running";
    case ClockState::PAUSED:          return "paused";
    case ClockState::REVERSING:       return "reversing";
    }
    return "unknown";
}
