#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "config/SimulationConfig.h"
#include "core/Types.h"

// =============================================================================
// Structured commands accepted at the simulator boundary.
//
// Whatever produces them (viewer buttons, a voice/NL adapter, a test) must
// hand over fully resolved ids and numbers; the core never parses free text.
// =============================================================================

using ParamValue = std::variant<double, std::string>;
using TaskParameters = std::map<std::string, ParamValue>;

struct MoveCommand {
    std::vector<std::string> droneIds;
    double targetX = 0.0;
    double targetY = 0.0;
};

struct TaskRequest {
    std::string taskName;
    std::vector<std::string> droneIds;
    TaskParameters parameters;
};

struct SetBaseCommand {
    std::vector<std::string> droneIds;
    std::string baseId;
};

struct PauseCommand {
    bool paused = true;
};

struct TimeControlCommand {
    TimeDirection direction = TimeDirection::FORWARD;
};

struct JumpBackCommand {};

// Without a config the world restarts under the current one.
struct ResetCommand {
    std::optional<SimulationConfig> config;
};

using ControlCommand = std::variant<
    MoveCommand,
    TaskRequest,
    SetBaseCommand,
    PauseCommand,
    TimeControlCommand,
    JumpBackCommand,
    ResetCommand>;

// "reverse" / "forward" -> direction; anything else is not a time action.
std::optional<TimeDirection> parseTimeAction(const std::string& action);

// -----------------------------------------------------------------------------
// Results
// -----------------------------------------------------------------------------

enum class CommandStatus {
    APPLIED,
    REJECTED
};

enum class CommandError {
    NONE,
    SCHEMA,        // missing / mistyped / out-of-range parameter
    UNKNOWN_TASK,  // task name not in the registry
    FRONT_END      // upstream adapter could not produce a command
};

struct CommandResult {
    CommandStatus status = CommandStatus::APPLIED;
    CommandError error = CommandError::NONE;
    std::string message;
    int updatedDrones = 0;
    std::vector<std::string> ignoredIds;   // unknown / ineligible references

    bool ok() const { return status == CommandStatus::APPLIED; }

    static CommandResult applied(int updated, const std::string& msg = "ok");
    static CommandResult rejected(CommandError error, const std::string& msg);
    static CommandResult frontEndFailure(const std::string& msg);
};

const char* toString(CommandError error);
