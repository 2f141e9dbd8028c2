#include "command/Task.h"

TaskKind kindOf(const Task& task) {
    return static_cast<TaskKind>(task.index());
}

const char* toString(TaskKind kind) {
    switch (kind) {
    case TaskKind::MOVE:           return "move";
    case TaskKind::PATROL:         return "patrol";
    case TaskKind::TAIL:           return "tail";
    case TaskKind::HOLD:           return "hold";
    case TaskKind::RETURN_TO_BASE: return "return_to_base";
    case TaskKind::INTERCEPT:      return "intercept";
    }
    return "unknown";
}
