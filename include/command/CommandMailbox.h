#pragma once
#include <mutex>
#include <vector>

#include "command/Commands.h"

// Inbox for commands produced outside the tick loop (UI thread, a slow
// voice/NL adapter, ...). Producers post() whenever they like; the simulator
// drains the whole inbox at a tick boundary and applies it before the tick,
// so nothing is ever applied halfway through a step.
class CommandMailbox {
public:
    void post(ControlCommand command);

    // Take every pending command, oldest first.
    std::vector<ControlCommand> drain();

    bool empty() const;

private:
    mutable std::mutex mutex;
    std::vector<ControlCommand> pending;
};
