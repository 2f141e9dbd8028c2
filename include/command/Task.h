#pragma once
#include <optional>
#include <string>
#include <variant>

#include "core/Drone.h"

// Closed set of drone tasks. Adding a kind means adding a struct here, a
// registry entry, and a branch in the simulator's applier; std::visit refuses
// to compile until all three agree.

enum class TaskKind {
    MOVE,
    PATROL,
    TAIL,
    HOLD,
    RETURN_TO_BASE,
    INTERCEPT
};

struct MoveTask {
    Vec2 destination{ 0.0 };
};

struct PatrolTask {
    PatternData pattern;   // entry phase is aligned per drone on assignment
};

struct TailTask {
    std::string targetId;
    double distance = 0.0;
};

struct HoldTask {};

struct ReturnToBaseTask {
    std::optional<std::string> baseId;   // nearest base when absent
};

struct InterceptTask {
    std::string targetId;
};

using Task = std::variant<
    MoveTask,
    PatrolTask,
    TailTask,
    HoldTask,
    ReturnToBaseTask,
    InterceptTask>;

TaskKind kindOf(const Task& task);
const char* toString(TaskKind kind);
