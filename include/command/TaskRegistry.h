#pragma once
#include <optional>
#include <string>
#include <vector>

#include "command/Commands.h"
#include "command/Task.h"
#include "config/SimulationConfig.h"

struct TaskParseResult {
    std::optional<Task> task;
    CommandResult error;      // meaningful only when task is empty

    bool ok() const { return task.has_value(); }
};

// The only place task names are strings. Everything past parse() works on the
// typed Task variant.
namespace TaskRegistry {

    // Registered names, in registry order.
    const std::vector<std::string>& names();

    std::optional<TaskKind> lookup(const std::string& name);

    // Validate a request into a Task. Unknown names give UNKNOWN_TASK;
    // missing, mistyped or out-of-range parameters give SCHEMA. Defaults for
    // optional parameters come from `cfg`.
    TaskParseResult parse(const TaskRequest& request, const SimulationConfig& cfg);

}
