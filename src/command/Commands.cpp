#include "command/Commands.h"

std::optional<TimeDirection> parseTimeAction(const std::string& action) {
    if (action == "reverse") return TimeDirection::REVERSE;
    if (action == "forward") return TimeDirection::FORWARD;
    return std::nullopt;
}

CommandResult CommandResult::applied(int updated, const std::string& msg) {
    CommandResult r;
    r.status = CommandStatus::APPLIED;
    r.updatedDrones = updated;
    r.message = msg;
    return r;
}

CommandResult CommandResult::rejected(CommandError error, const std::string& msg) {
    CommandResult r;
    r.status = CommandStatus::REJECTED;
    r.error = error;
    r.message = msg;
    return r;
}

CommandResult CommandResult::frontEndFailure(const std::string& msg) {
    return rejected(CommandError::FRONT_END, msg);
}

const char* toString(CommandError error) {
    switch (error) {
    case CommandError::NONE:         return "none";
    case CommandError::SCHEMA:       return "schema";
    case CommandError::UNKNOWN_TASK: return "unknown_task";
    case CommandError::FRONT_END:    return "front_end";
    }
    return "unknown";
}
